#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/stream/buffered_stream.hpp"

namespace txfeed::stream {

/*
  In-memory paginated stream.

  Serves `page_size` items per FetchPage() call (0 = everything in one page).
  Items must already be ordered newest first.
*/
class MemoryStream : public BufferedStream {
 public:
  MemoryStream(std::string name, std::vector<model::Transaction> items, std::size_t page_size = 0);

  std::size_t Size() const {
    return items_.size();
  }

 protected:
  Page FetchPage(const std::optional<std::string>& cursor) override;

 private:
  std::vector<model::Transaction> items_;
  std::size_t                     page_size_;
};

} // namespace txfeed::stream
