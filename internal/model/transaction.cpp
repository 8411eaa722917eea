#include "transaction.hpp"

#include "internal/util/overloaded.hpp"

namespace txfeed::model {

SourceKind KindOf(const Transaction& tx) {
  return std::visit(util::Overloaded{
                        [](const BitcoinTransaction&) { return SourceKind::kBitcoin; },
                        [](const StacksTransaction&) { return SourceKind::kStacks; },
                        [](const StarknetTransaction&) { return SourceKind::kStarknet; },
                        [](const SparkTransaction&) { return SourceKind::kSpark; },
                    },
                    tx);
}

std::string_view ToString(SourceKind kind) {
  switch (kind) {
    case SourceKind::kBitcoin:
      return "bitcoin";
    case SourceKind::kStacks:
      return "stacks";
    case SourceKind::kStarknet:
      return "starknet";
    case SourceKind::kSpark:
      return "spark";
  }
  return "unknown";
}

const std::string& IdOf(const Transaction& tx) {
  return std::visit(util::Overloaded{
                        [](const BitcoinTransaction& t) -> const std::string& { return t.txid; },
                        [](const StacksTransaction& t) -> const std::string& { return t.tx_id; },
                        [](const StarknetTransaction& t) -> const std::string& { return t.transaction_hash; },
                        [](const SparkTransaction& t) -> const std::string& { return t.id; },
                    },
                    tx);
}

} // namespace txfeed::model
