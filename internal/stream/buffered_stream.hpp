#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "internal/stream/transaction_stream.hpp"

namespace txfeed::stream {

/*
  One page returned by a paginated feed.

  next_cursor is empty on the last page.
*/
struct Page {
  std::vector<model::Transaction> items;
  std::optional<std::string>      next_cursor;
};

/*
  Paginated stream with an explicit lookahead slot.

  Subclasses only implement FetchPage(); this class owns the buffered page,
  the continuation cursor and the single peeked item that makes Peek()
  non-consuming.

  An empty page that still carries a cursor is skipped, not treated as the end.
*/
class BufferedStream : public TransactionStream {
 public:
  explicit BufferedStream(std::string name);

  std::optional<model::Transaction> Peek() override;

  NextResult Next() override;

  std::string_view Name() const override {
    return name_;
  }

  std::uint64_t PagesFetched() const {
    return pages_fetched_;
  }

 protected:
  // cursor is empty for the first page. May throw.
  virtual Page FetchPage(const std::optional<std::string>& cursor) = 0;

 private:
  bool Fill();

  std::string name_;

  std::optional<model::Transaction> lookahead_;
  std::deque<model::Transaction>    buffer_;
  std::optional<std::string>        cursor_;
  bool                              started_   = false;
  bool                              exhausted_ = false;
  std::uint64_t                     pages_fetched_ = 0;
};

} // namespace txfeed::stream
