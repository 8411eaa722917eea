#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace txfeed::model {

enum class SourceKind {
  kBitcoin,
  kStacks,
  kStarknet,
  kSpark,
};

struct BitcoinTransaction {
  std::string                 txid;
  std::optional<std::int64_t> block_time;
};

struct StacksTransaction {
  std::string                 tx_id;
  std::optional<std::int64_t> block_time;
  std::optional<std::int64_t> burn_block_time;
};

struct StarknetTransaction {
  std::string transaction_hash;
  std::string block_timestamp;
};

struct SparkTransaction {
  std::string                id;
  std::optional<std::string> created_at;
};

/*
  Closed sum over every supported feed.

  Adding an alternative here breaks every std::visit that does not handle it,
  which is how the normalizer stays exhaustive.
*/
using Transaction = std::variant<BitcoinTransaction, StacksTransaction, StarknetTransaction, SparkTransaction>;

SourceKind       KindOf(const Transaction& tx);
std::string_view ToString(SourceKind kind);

// Source-native identifier (txid, tx_id, hash, id).
const std::string& IdOf(const Transaction& tx);

} // namespace txfeed::model
