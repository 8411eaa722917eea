#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/model/transaction.hpp"
#include "internal/util/errors.hpp"

namespace {

using txfeed::runtime::config::RuntimeConfig;

std::filesystem::path TestDir() {
  const auto dir = std::filesystem::temp_directory_path() / "txfeed_factory_tests";
  std::filesystem::create_directories(dir / "fixtures");
  return dir;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path);
  out << content;
  out.close();
}

void WriteFixtures(const std::filesystem::path& dir) {
  WriteFile(dir / "fixtures" / "a.yaml", R"(transactions:
  - bitcoin:
      txid: "a-1"
      block_time: 100
  - bitcoin:
      txid: "a-2"
      block_time: 50
)");
  WriteFile(dir / "fixtures" / "b.yaml", R"(transactions:
  - stacks:
      tx_id: "b-1"
      block_time: 100
)");
}

void TestBuildsStreamsInDeclaredOrder() {
  const auto dir = TestDir();
  WriteFixtures(dir);
  WriteFile(dir / "txfeed.yaml", R"(merge:
  default_limit: 5
sources:
  - name: a
    fixture_path: fixtures/a.yaml
    page_size: 1
  - name: b
    fixture_path: fixtures/b.yaml
)");

  const auto config = txfeed::config::ConfigLoader::LoadFromYaml((dir / "txfeed.yaml").string());
  auto       app    = txfeed::factory::Build(config, dir);

  assert(app.streams.size() == 2);
  assert(app.streams[0]->Name() == "a");
  assert(app.streams[1]->Name() == "b");
  assert(app.default_limit == 5);

  // a-1 and b-1 tie at 100; the first declared source wins.
  const auto result = app.merger->TakeN(app.default_limit);
  assert(result.size() == 3);
  assert(txfeed::model::IdOf(result[0]) == "a-1");
  assert(txfeed::model::IdOf(result[1]) == "b-1");
  assert(txfeed::model::IdOf(result[2]) == "a-2");
}

void TestAbsoluteFixturePathsAreKept() {
  const auto dir = TestDir();
  WriteFixtures(dir);

  RuntimeConfig config;
  auto*         source = config.add_sources();
  source->set_name("b");
  source->set_fixture_path((dir / "fixtures" / "b.yaml").string());

  auto app = txfeed::factory::Build(config, "/nonexistent");
  assert(app.default_limit == txfeed::config::kDefaultTakeLimit);
  assert(app.merger->TakeN(1).size() == 1);
}

void TestInvalidConfigIsRejectedBeforeLoading() {
  RuntimeConfig config;
  bool          threw = false;
  try {
    (void)txfeed::factory::Build(config, TestDir());
  } catch (const txfeed::util::InvalidConfiguration&) {
    threw = true;
  }
  assert(threw);

  auto* source = config.add_sources();
  source->set_name("missing");
  source->set_fixture_path("fixtures/missing.yaml");
  std::filesystem::remove(TestDir() / "fixtures" / "missing.yaml");

  threw = false;
  try {
    (void)txfeed::factory::Build(config, TestDir());
  } catch (const txfeed::util::InvalidFixture&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuildsStreamsInDeclaredOrder();
  TestAbsoluteFixturePathsAreKept();
  TestInvalidConfigIsRejectedBeforeLoading();

  std::cout << "txfeed_unit_factory: pass\n";
  return 0;
}
