#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "fixture/fixture.pb.h"
#include "internal/model/transaction.hpp"
#include "internal/stream/memory_stream.hpp"

namespace txfeed::fixture {

/*
  Fixture replay.

  A fixture is a YAML StreamFixture (proto/fixture/fixture.proto) listing one
  feed's transactions newest first. Timestamps are carried verbatim; they are
  only parsed when the merger orders them.
*/

// Throws util::InvalidFixture when the record has no source kind set.
model::Transaction ToTransaction(const txfeed::fixture::v1::TransactionRecord& record);

// Throws util::InvalidFixture when the file cannot be read or does not match the schema.
std::vector<model::Transaction> LoadTransactions(const std::string& path);

std::shared_ptr<stream::MemoryStream> LoadStream(std::string name, const std::string& path, std::size_t page_size);

} // namespace txfeed::fixture
