#include "internal/fixture/fixture_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <variant>

#include "internal/util/errors.hpp"

namespace {

using txfeed::fixture::v1::TransactionRecord;
using txfeed::model::BitcoinTransaction;
using txfeed::model::IdOf;
using txfeed::model::SparkTransaction;
using txfeed::model::StacksTransaction;
using txfeed::model::StarknetTransaction;
using txfeed::util::InvalidFixture;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "txfeed_fixture_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestConvertsEachSourceKind() {
  {
    TransactionRecord record;
    record.mutable_bitcoin()->set_txid("btc-1");
    record.mutable_bitcoin()->set_block_time(1717003600);
    const auto  tx  = txfeed::fixture::ToTransaction(record);
    const auto& btc = std::get<BitcoinTransaction>(tx);
    assert(btc.txid == "btc-1");
    assert(btc.block_time == 1717003600);
  }
  {
    TransactionRecord record;
    record.mutable_bitcoin()->set_txid("btc-mempool");
    const auto tx = txfeed::fixture::ToTransaction(record);
    assert(!std::get<BitcoinTransaction>(tx).block_time.has_value());
  }
  {
    TransactionRecord record;
    record.mutable_stacks()->set_tx_id("stx-1");
    record.mutable_stacks()->set_block_time(0);
    record.mutable_stacks()->set_burn_block_time(1716999000);
    const auto  tx  = txfeed::fixture::ToTransaction(record);
    const auto& stx = std::get<StacksTransaction>(tx);
    // An explicit zero is kept distinct from an absent field.
    assert(stx.block_time.has_value() && *stx.block_time == 0);
    assert(stx.burn_block_time == 1716999000);
  }
  {
    TransactionRecord record;
    record.mutable_starknet()->set_transaction_hash("0xabc");
    record.mutable_starknet()->set_block_timestamp("2024-05-29T16:00:00+00:00");
    const auto  tx = txfeed::fixture::ToTransaction(record);
    const auto& sn = std::get<StarknetTransaction>(tx);
    assert(sn.transaction_hash == "0xabc");
    assert(sn.block_timestamp == "2024-05-29T16:00:00+00:00");
  }
  {
    TransactionRecord record;
    record.mutable_spark()->set_id("spark-1");
    const auto tx = txfeed::fixture::ToTransaction(record);
    assert(!std::get<SparkTransaction>(tx).created_at.has_value());
  }
}

void TestRecordWithoutKindIsRejected() {
  bool threw = false;
  try {
    (void)txfeed::fixture::ToTransaction(TransactionRecord{});
  } catch (const InvalidFixture&) {
    threw = true;
  }
  assert(threw);
}

void TestLoadStreamReplaysFileInOrder() {
  const auto path = WriteYaml("mixed",
                              R"(transactions:
  - starknet:
      transaction_hash: 0x04a1
      block_timestamp: "2024-05-29T17:26:40Z"
  - bitcoin:
      txid: "00ff"
      block_time: 1716998400
  - spark:
      id: spark-7
      created_at: "2024-05-29T17:00:00Z"
)");

  auto stream = txfeed::fixture::LoadStream("mixed", path.string(), 2);
  assert(stream->Name() == "mixed");
  assert(stream->Size() == 3);

  auto first = stream->Next();
  assert(!first.done && IdOf(*first.value) == "0x04a1");
  assert(IdOf(*stream->Next().value) == "00ff");
  assert(IdOf(*stream->Next().value) == "spark-7");
  assert(stream->Next().done);
}

void TestBadFixturesAreReported() {
  const auto no_kind = WriteYaml("no_kind",
                                 R"(transactions:
  - bitcoin:
      txid: "ok"
  - {}
)");
  std::string message;
  try {
    (void)txfeed::fixture::LoadTransactions(no_kind.string());
  } catch (const InvalidFixture& e) {
    message = e.what();
  }
  assert(message.find("transactions[1]") != std::string::npos);

  const auto unknown = WriteYaml("unknown_field",
                                 R"(transactions:
  - bitcoin:
      txid: "ok"
      fee: 12
)");
  bool threw = false;
  try {
    (void)txfeed::fixture::LoadTransactions(unknown.string());
  } catch (const InvalidFixture&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestConvertsEachSourceKind();
  TestRecordWithoutKindIsRejected();
  TestLoadStreamReplaysFileInOrder();
  TestBadFixturesAreReported();

  std::cout << "txfeed_unit_fixture_loader: pass\n";
  return 0;
}
