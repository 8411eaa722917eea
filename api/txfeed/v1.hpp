#pragma once

#include "internal/merge/stream_merger.hpp"
#include "internal/merge/timestamp_normalizer.hpp"
#include "internal/model/transaction.hpp"
#include "internal/stream/buffered_stream.hpp"
#include "internal/stream/memory_stream.hpp"
#include "internal/stream/transaction_stream.hpp"
#include "internal/util/errors.hpp"

namespace txfeed::v1 {
using namespace ::txfeed::model;
using namespace ::txfeed::stream;
using namespace ::txfeed::merge;
using namespace ::txfeed::util;
}
