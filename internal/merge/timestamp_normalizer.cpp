#include "timestamp_normalizer.hpp"

#include "internal/util/overloaded.hpp"
#include "internal/util/time.hpp"

namespace txfeed::merge {

using namespace txfeed::model;

MergeKey MergeKeyOf(const Transaction& tx) {
  return std::visit(util::Overloaded{
                        [](const BitcoinTransaction& t) -> MergeKey { return t.block_time.value_or(0); },
                        [](const StacksTransaction& t) -> MergeKey {
                          if (t.block_time && *t.block_time > 0) {
                            return *t.block_time;
                          }
                          if (t.burn_block_time) {
                            return *t.burn_block_time;
                          }
                          return kPendingMergeKey;
                        },
                        [](const StarknetTransaction& t) -> MergeKey {
                          return util::ToUnixSeconds(util::ParseTimestamp(t.block_timestamp));
                        },
                        [](const SparkTransaction& t) -> MergeKey {
                          if (!t.created_at) {
                            return 0;
                          }
                          return util::ToUnixSeconds(util::ParseTimestamp(*t.created_at));
                        },
                    },
                    tx);
}

} // namespace txfeed::merge
