#include "fixture_loader.hpp"

#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace txfeed::fixture {

using namespace txfeed::fixture::v1;

model::Transaction ToTransaction(const TransactionRecord& record) {
  switch (record.kind_case()) {
    case TransactionRecord::kBitcoin: {
      const auto&               src = record.bitcoin();
      model::BitcoinTransaction tx;
      tx.txid = src.txid();
      if (src.has_block_time()) tx.block_time = src.block_time();
      return tx;
    }

    case TransactionRecord::kStacks: {
      const auto&              src = record.stacks();
      model::StacksTransaction tx;
      tx.tx_id = src.tx_id();
      if (src.has_block_time()) tx.block_time = src.block_time();
      if (src.has_burn_block_time()) tx.burn_block_time = src.burn_block_time();
      return tx;
    }

    case TransactionRecord::kStarknet: {
      const auto&                src = record.starknet();
      model::StarknetTransaction tx;
      tx.transaction_hash = src.transaction_hash();
      tx.block_timestamp  = src.block_timestamp();
      return tx;
    }

    case TransactionRecord::kSpark: {
      const auto&             src = record.spark();
      model::SparkTransaction tx;
      tx.id = src.id();
      if (src.has_created_at()) tx.created_at = src.created_at();
      return tx;
    }

    case TransactionRecord::KIND_NOT_SET:
      break;
  }

  throw util::InvalidFixture("fixture: transaction record has no source kind; set one of bitcoin, stacks, starknet, spark");
}

std::vector<model::Transaction> LoadTransactions(const std::string& path) {
  StreamFixture fixture;
  try {
    config::ConfigLoader::LoadMessageFromYaml(path, &fixture);
  } catch (const util::InvalidConfiguration& e) {
    throw util::InvalidFixture(std::string("fixture: ") + e.what());
  }

  std::vector<model::Transaction> transactions;
  transactions.reserve(fixture.transactions_size());
  for (int i = 0; i < fixture.transactions_size(); ++i) {
    try {
      transactions.push_back(ToTransaction(fixture.transactions(i)));
    } catch (const util::InvalidFixture& e) {
      throw util::InvalidFixture(path + ": transactions[" + std::to_string(i) + "]: " + e.what());
    }
  }
  return transactions;
}

std::shared_ptr<stream::MemoryStream> LoadStream(std::string name, const std::string& path, std::size_t page_size) {
  auto transactions = LoadTransactions(path);

  TXFEED_LOG_DEBUG("fixture loaded", {observability::StringField("source", name), observability::StringField("path", path),
                                      observability::IntField("transactions", static_cast<std::int64_t>(transactions.size())),
                                      observability::IntField("page_size", static_cast<std::int64_t>(page_size))});

  return std::make_shared<stream::MemoryStream>(std::move(name), std::move(transactions), page_size);
}

} // namespace txfeed::fixture
