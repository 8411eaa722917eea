#pragma once

#include <optional>
#include <string_view>

#include "internal/model/transaction.hpp"

namespace txfeed::stream {

struct NextResult {
  bool                              done = false;
  std::optional<model::Transaction> value;
};

/*
  Sequential cursor over one feed.

  CONTRACT:

  - Peek() reports the item Next() would produce, without advancing.
    Repeated Peek() calls with no Next() in between return the same item.
    Empty once the feed is exhausted.
  - Next() advances and returns the item Peek() last reported, or done=true.
    done=false with no value is a transient empty result, not exhaustion.
  - Emission order is newest first (non-increasing MergeKey).

  Implementations may block on I/O and may throw; errors propagate to the caller.
  A stream is driven by one merger at a time and needs no internal locking.
*/

class TransactionStream {
 public:
  virtual ~TransactionStream() = default;

  virtual std::optional<model::Transaction> Peek() = 0;

  virtual NextResult Next() = 0;

  // Label used in logs.
  virtual std::string_view Name() const = 0;
};

} // namespace txfeed::stream
