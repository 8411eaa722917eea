#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using txfeed::util::ClassifyError;
using txfeed::util::ErrorKind;

void TestClassifiesEachErrorType() {
  assert(ClassifyError(txfeed::util::InvalidConfiguration("x")) == ErrorKind::kConfiguration);
  assert(ClassifyError(txfeed::util::InvalidFixture("x")) == ErrorKind::kConfiguration);
  assert(ClassifyError(txfeed::util::InvalidRequest("x")) == ErrorKind::kInvalidRequest);
  assert(ClassifyError(txfeed::util::MalformedTimestamp("x", "raw")) == ErrorKind::kMalformedData);
  assert(ClassifyError(txfeed::util::MergeStalled("x")) == ErrorKind::kStall);

  // Anything a stream throws on its own is a stream failure.
  assert(ClassifyError(std::runtime_error("HTTP 503")) == ErrorKind::kStreamFailure);
  assert(ClassifyError(std::out_of_range("x")) == ErrorKind::kStreamFailure);
}

void TestMalformedTimestampKeepsRawValue() {
  const txfeed::util::MalformedTimestamp e("unparseable timestamp", "yesterday");
  assert(e.raw_value() == "yesterday");
  assert(std::string(e.what()) == "unparseable timestamp: 'yesterday'");
}

void TestKindNames() {
  assert(txfeed::util::ToString(ErrorKind::kConfiguration) == "configuration");
  assert(txfeed::util::ToString(ErrorKind::kInvalidRequest) == "invalid_request");
  assert(txfeed::util::ToString(ErrorKind::kMalformedData) == "malformed_data");
  assert(txfeed::util::ToString(ErrorKind::kStall) == "stall");
  assert(txfeed::util::ToString(ErrorKind::kStreamFailure) == "stream_failure");
}

} // namespace

int main() {
  TestClassifiesEachErrorType();
  TestMalformedTimestampKeepsRawValue();
  TestKindNames();

  std::cout << "txfeed_unit_errors: pass\n";
  return 0;
}
