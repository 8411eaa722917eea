#include "stream_merger.hpp"

#include <cmath>
#include <future>
#include <sstream>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace txfeed::merge {

using txfeed::observability::BoolField;
using txfeed::observability::IntField;
using txfeed::observability::StringField;

namespace {

void ValidateLimit(std::int64_t limit) {
  if (limit < 1) {
    throw util::InvalidRequest("take: limit must be a positive integer, got " + std::to_string(limit));
  }
  if (limit > kMaxTakeLimit) {
    throw util::InvalidRequest("take: limit " + std::to_string(limit) + " exceeds maximum of " + std::to_string(kMaxTakeLimit));
  }
}

} // namespace

std::int64_t LimitFromNumber(double requested) {
  if (!std::isfinite(requested)) {
    throw util::InvalidRequest("take: limit must be a finite number");
  }

  std::ostringstream shown;
  shown << requested;
  if (std::trunc(requested) != requested) {
    throw util::InvalidRequest("take: limit must be an integer, got " + shown.str());
  }
  // Range check on the double so huge values never reach the integer cast.
  if (requested < 1) {
    throw util::InvalidRequest("take: limit must be a positive integer, got " + shown.str());
  }
  if (requested > static_cast<double>(kMaxTakeLimit)) {
    throw util::InvalidRequest("take: limit " + shown.str() + " exceeds maximum of " + std::to_string(kMaxTakeLimit));
  }
  return static_cast<std::int64_t>(requested);
}

StreamMerger::StreamMerger(std::vector<std::shared_ptr<stream::TransactionStream>> streams) : streams_(std::move(streams)) {
  if (streams_.empty()) {
    throw util::InvalidConfiguration("stream merger: at least one stream is required");
  }
  for (std::size_t i = 0; i < streams_.size(); ++i) {
    if (!streams_[i]) {
      throw util::InvalidConfiguration("stream merger: stream at index " + std::to_string(i) + " is null");
    }
  }

  TXFEED_LOG_DEBUG("stream merger created", {IntField("streams", static_cast<std::int64_t>(streams_.size()))});
}

// ------------------------------------------------------------
// TakeN
// ------------------------------------------------------------

std::vector<model::Transaction> StreamMerger::TakeN(std::int64_t limit) {
  ValidateLimit(limit);

  const auto                      wanted = static_cast<std::size_t>(limit);
  std::vector<model::Transaction> results;
  results.reserve(wanted);

  int           empty_rounds = 0;
  std::uint64_t round        = 0;

  while (results.size() < wanted) {
    ++round;

    const auto peeks  = PeekAll();
    const auto winner = SelectWinner(peeks);
    if (!winner) {
      TXFEED_LOG_DEBUG("all streams exhausted", {IntField("round", static_cast<std::int64_t>(round)),
                                                 IntField("collected", static_cast<std::int64_t>(results.size()))});
      break;
    }

    auto& stream = *streams_[winner->stream_index];
    TXFEED_LOG_DEBUG("merge round", {IntField("round", static_cast<std::int64_t>(round)), StringField("winner", stream.Name()),
                                     IntField("winner_index", static_cast<std::int64_t>(winner->stream_index)),
                                     IntField("merge_key", winner->key)});

    auto next = stream.Next();
    if (next.done || !next.value) {
      ++empty_rounds;
      if (empty_rounds >= kMaxEmptyRounds) {
        TXFEED_LOG_ERROR("merge stalled", {StringField("stream", stream.Name()), IntField("empty_rounds", empty_rounds)});
        throw util::MergeStalled("take: " + std::to_string(empty_rounds) +
                                 " consecutive rounds produced no transaction (possible infinite loop); last winner was stream '" +
                                 std::string(stream.Name()) + "'");
      }
      TXFEED_LOG_WARN("winning stream produced no transaction",
                      {StringField("stream", stream.Name()), BoolField("done", next.done), IntField("empty_rounds", empty_rounds)});
      continue;
    }

    empty_rounds = 0;
    results.push_back(std::move(*next.value));
  }

  return results;
}

// ------------------------------------------------------------
// Round helpers
// ------------------------------------------------------------

std::vector<std::optional<model::Transaction>> StreamMerger::PeekAll() {
  std::vector<std::optional<model::Transaction>> peeks;
  peeks.reserve(streams_.size());

  if (streams_.size() == 1) {
    peeks.push_back(streams_.front()->Peek());
    return peeks;
  }

  std::vector<std::future<std::optional<model::Transaction>>> pending;
  pending.reserve(streams_.size());
  for (const auto& stream : streams_) {
    pending.push_back(std::async(std::launch::async, [s = stream.get()] { return s->Peek(); }));
  }

  // Barrier: every peek finishes before any failure is surfaced, so nothing
  // keeps running against a stream after TakeN() returns or throws.
  for (auto& f : pending) {
    f.wait();
  }

  for (std::size_t i = 0; i < pending.size(); ++i) {
    try {
      peeks.push_back(pending[i].get());
    } catch (const std::exception& e) {
      TXFEED_LOG_ERROR("stream peek failed", {StringField("stream", streams_[i]->Name()), StringField("error", e.what())});
      throw;
    }
  }
  return peeks;
}

std::optional<StreamMerger::Candidate> StreamMerger::SelectWinner(const std::vector<std::optional<model::Transaction>>& peeks) {
  std::optional<Candidate> best;
  for (std::size_t i = 0; i < peeks.size(); ++i) {
    if (!peeks[i]) {
      continue;
    }
    const MergeKey key = MergeKeyOf(*peeks[i]);
    // Strictly greater: on equal keys the earlier (lower index) stream keeps the win.
    if (!best || key > best->key) {
      best = Candidate{i, key};
    }
  }
  return best;
}

} // namespace txfeed::merge
