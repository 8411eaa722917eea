#include "memory_stream.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace txfeed::stream {

MemoryStream::MemoryStream(std::string name, std::vector<model::Transaction> items, std::size_t page_size)
    : BufferedStream(std::move(name)), items_(std::move(items)), page_size_(page_size) {
}

Page MemoryStream::FetchPage(const std::optional<std::string>& cursor) {
  std::size_t offset = 0;
  if (cursor) {
    try {
      offset = static_cast<std::size_t>(std::stoull(*cursor));
    } catch (const std::exception&) {
      throw std::invalid_argument("memory stream " + std::string(Name()) + ": bad cursor '" + *cursor + "'");
    }
  }
  offset = std::min(offset, items_.size());

  const std::size_t count = page_size_ == 0 ? items_.size() - offset : std::min(page_size_, items_.size() - offset);

  Page page;
  page.items.assign(items_.begin() + offset, items_.begin() + offset + count);
  if (offset + count < items_.size()) {
    page.next_cursor = std::to_string(offset + count);
  }
  return page;
}

} // namespace txfeed::stream
