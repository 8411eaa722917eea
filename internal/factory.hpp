#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/merge/stream_merger.hpp"
#include "internal/stream/transaction_stream.hpp"

namespace txfeed::factory {

/*
  Application

  Owns the streams and the merger built from one RuntimeConfig.
*/
struct Application {
  std::vector<std::shared_ptr<stream::TransactionStream>> streams;
  std::unique_ptr<merge::StreamMerger>                    merger;
  std::int64_t                                            default_limit = 0;
};

/*
  Build

  Composition root: validates the config, loads every source in declared
  order (that order is the merger's tie-break order) and wires the merger.
  Relative fixture paths resolve against `base_dir`.
*/
Application Build(const txfeed::runtime::config::RuntimeConfig& config, const std::filesystem::path& base_dir);

} // namespace txfeed::factory
