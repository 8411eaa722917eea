#pragma once

#include <cstdint>
#include <limits>

#include "internal/model/transaction.hpp"

namespace txfeed::merge {

/*
  MergeKey

  Seconds since the epoch, used only to order transactions across feeds.
  Larger keys are newer.
*/
using MergeKey = std::int64_t;

// Key for items with no time information yet (pending stacks transactions).
// Sorts ahead of every real timestamp.
inline constexpr MergeKey kPendingMergeKey = std::numeric_limits<MergeKey>::max();

/*
  Maps a transaction to its MergeKey:

    bitcoin   block_time, else 0
    stacks    block_time when > 0, else burn_block_time (any value), else kPendingMergeKey
    starknet  block_timestamp parsed as ISO-8601
    spark     created_at parsed as ISO-8601, epoch when absent

  Throws util::MalformedTimestamp when a starknet/spark timestamp does not parse.
*/
MergeKey MergeKeyOf(const model::Transaction& tx);

} // namespace txfeed::merge
