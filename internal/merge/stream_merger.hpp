#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/merge/timestamp_normalizer.hpp"
#include "internal/model/transaction.hpp"
#include "internal/stream/transaction_stream.hpp"

namespace txfeed::merge {

// Upper bound on a single TakeN() call.
inline constexpr std::int64_t kMaxTakeLimit = 10000;

// Consecutive rounds without an appended item before TakeN() gives up.
inline constexpr int kMaxEmptyRounds = 3;

// Validates an untyped numeric limit (CLI text, YAML scalar) and returns it as an integer.
// Throws util::InvalidRequest for NaN, infinities, fractions, < 1 or > kMaxTakeLimit.
std::int64_t LimitFromNumber(double requested);

/*
  StreamMerger

  k-way merge of independently paginated feeds into one newest-first sequence.

  Each round:
    1. Peek() every stream concurrently and wait for all of them.
    2. Pick the candidate with the highest MergeKey; ties go to the lowest stream index.
    3. Next() only the winning stream and append what it yields.

  Non-winning streams keep their peeked item for the next round.
  The stream list is fixed at construction; streams are not owned beyond
  the calls made on them and must not be shared with a concurrent merger.
*/
class StreamMerger {
 public:
  // Throws util::InvalidConfiguration if `streams` is empty or holds a null stream.
  explicit StreamMerger(std::vector<std::shared_ptr<stream::TransactionStream>> streams);

  /*
    Returns up to `limit` transactions, newest first.

    Short results are normal when every stream runs dry.
    Throws:
      util::InvalidRequest      limit < 1 or > kMaxTakeLimit (before any stream I/O)
      util::MalformedTimestamp  a peeked item has an unparseable timestamp
      util::MergeStalled        kMaxEmptyRounds consecutive rounds appended nothing
      anything a stream throws from Peek()/Next()
    No partial result is returned on error.
  */
  std::vector<model::Transaction> TakeN(std::int64_t limit);

  std::size_t StreamCount() const {
    return streams_.size();
  }

 private:
  struct Candidate {
    std::size_t stream_index = 0;
    MergeKey    key          = 0;
  };

  std::vector<std::optional<model::Transaction>> PeekAll();

  static std::optional<Candidate> SelectWinner(const std::vector<std::optional<model::Transaction>>& peeks);

  std::vector<std::shared_ptr<stream::TransactionStream>> streams_;
};

} // namespace txfeed::merge
