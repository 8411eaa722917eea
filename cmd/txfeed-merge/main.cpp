#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/merge/stream_merger.hpp"
#include "internal/merge/timestamp_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using txfeed::observability::StringField;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  txfeed-merge <config.yaml>\n"
            << "  txfeed-merge --config <config.yaml> [--limit <n>]\n";
}

static int ExitCodeFor(txfeed::util::ErrorKind kind) {
  switch (kind) {
    case txfeed::util::ErrorKind::kConfiguration:
      return 2;
    case txfeed::util::ErrorKind::kInvalidRequest:
      return 3;
    case txfeed::util::ErrorKind::kMalformedData:
      return 4;
    case txfeed::util::ErrorKind::kStall:
      return 5;
    case txfeed::util::ErrorKind::kStreamFailure:
      return 1;
  }
  return 1;
}

static std::int64_t ParseLimit(const std::string& text) {
  char*        endptr = nullptr;
  const double value  = std::strtod(text.c_str(), &endptr);
  if (text.empty() || !endptr || *endptr != '\0') {
    throw txfeed::util::InvalidRequest("--limit: '" + text + "' is not a number");
  }
  return txfeed::merge::LimitFromNumber(value);
}

int main(int argc, char** argv) {
  std::string                config_path;
  std::optional<std::string> limit_text;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--limit" && i + 1 < argc) {
      limit_text = argv[++i];
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      Usage();
      return 1;
    }
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  bool logging_ready = false;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = txfeed::config::ConfigLoader::LoadFromYaml(config_path);

    txfeed::observability::InitializeLogging(config);
    logging_ready = true;

    // ------------------------------------------------------------
    // Build application (streams + merger)
    // ------------------------------------------------------------
    auto app = txfeed::factory::Build(config, std::filesystem::path(config_path).parent_path());

    const auto limit = limit_text ? ParseLimit(*limit_text) : app.default_limit;

    // ------------------------------------------------------------
    // Merge
    // ------------------------------------------------------------
    const auto transactions = app.merger->TakeN(limit);

    std::size_t index = 0;
    for (const auto& tx : transactions) {
      const auto key = txfeed::merge::MergeKeyOf(tx);
      std::cout << index++ << '\t' << txfeed::model::ToString(txfeed::model::KindOf(tx)) << '\t' << txfeed::model::IdOf(tx) << '\t';
      if (key == txfeed::merge::kPendingMergeKey) {
        std::cout << "pending";
      } else {
        std::cout << key;
      }
      std::cout << '\n';
    }

    TXFEED_LOG_INFO("merge complete", {txfeed::observability::IntField("requested", limit),
                                       txfeed::observability::IntField("returned", static_cast<std::int64_t>(transactions.size()))});
    txfeed::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    const auto kind = txfeed::util::ClassifyError(e);
    if (logging_ready) {
      TXFEED_LOG_ERROR("Fatal error", {StringField("kind", txfeed::util::ToString(kind)), StringField("error", e.what())});
      txfeed::observability::ShutdownLogging();
    } else {
      std::cerr << "txfeed-merge: " << txfeed::util::ToString(kind) << ": " << e.what() << std::endl;
    }
    return ExitCodeFor(kind);
  }

  return 0;
}
