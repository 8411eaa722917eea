#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "txfeed/v1.hpp"

namespace {

// Pretends to page through a remote bitcoin explorer: two pages, newest first.
class ExplorerPagesStream : public txfeed::v1::BufferedStream {
 public:
  ExplorerPagesStream() : BufferedStream("bitcoin-explorer") {
  }

 protected:
  txfeed::v1::Page FetchPage(const std::optional<std::string>& cursor) override {
    txfeed::v1::Page page;
    if (!cursor) {
      page.items.push_back(txfeed::v1::BitcoinTransaction{"btc-3", 1700000300});
      page.items.push_back(txfeed::v1::BitcoinTransaction{"btc-2", 1700000200});
      page.next_cursor = "page-2";
      return page;
    }
    page.items.push_back(txfeed::v1::BitcoinTransaction{"btc-1", 1700000100});
    return page;
  }
};

} // namespace

int main() {
  std::vector<txfeed::v1::Transaction> stacks_items;
  stacks_items.push_back(txfeed::v1::StacksTransaction{"stx-pending", std::nullopt, std::nullopt});
  stacks_items.push_back(txfeed::v1::StacksTransaction{"stx-1", 1700000250, 1700000240});

  std::vector<std::shared_ptr<txfeed::v1::TransactionStream>> streams;
  streams.push_back(std::make_shared<ExplorerPagesStream>());
  streams.push_back(std::make_shared<txfeed::v1::MemoryStream>("stacks", std::move(stacks_items), 1));

  try {
    txfeed::v1::StreamMerger merger(std::move(streams));

    // Two calls continue where the previous one stopped.
    for (const std::int64_t limit : {3, 10}) {
      const auto page = merger.TakeN(limit);
      std::cout << "take " << limit << " -> " << page.size() << " transactions\n";
      for (const auto& tx : page) {
        std::cout << "  " << txfeed::v1::ToString(txfeed::v1::KindOf(tx)) << ' ' << txfeed::v1::IdOf(tx) << '\n';
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "merge failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
