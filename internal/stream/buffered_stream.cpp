#include "buffered_stream.hpp"

#include <stdexcept>
#include <utility>

namespace txfeed::stream {

BufferedStream::BufferedStream(std::string name) : name_(std::move(name)) {
}

std::optional<model::Transaction> BufferedStream::Peek() {
  if (!Fill()) {
    return std::nullopt;
  }
  return lookahead_;
}

NextResult BufferedStream::Next() {
  if (!Fill()) {
    return {true, std::nullopt};
  }

  NextResult result;
  result.value = std::move(lookahead_);
  lookahead_.reset();
  return result;
}

// ------------------------------------------------------------
// Lookahead refill
// ------------------------------------------------------------

bool BufferedStream::Fill() {
  if (lookahead_) {
    return true;
  }

  while (buffer_.empty()) {
    if (exhausted_) {
      return false;
    }
    if (started_ && !cursor_) {
      exhausted_ = true;
      return false;
    }

    // State is only updated after FetchPage returns, so a throwing fetch can be retried.
    Page page = FetchPage(cursor_);
    ++pages_fetched_;

    if (page.items.empty() && page.next_cursor && started_ && page.next_cursor == cursor_) {
      throw std::runtime_error("stream " + name_ + ": empty page did not advance cursor '" + *cursor_ + "'");
    }

    started_ = true;
    cursor_  = std::move(page.next_cursor);
    for (auto& item : page.items) {
      buffer_.push_back(std::move(item));
    }
  }

  lookahead_ = std::move(buffer_.front());
  buffer_.pop_front();
  return true;
}

} // namespace txfeed::stream
