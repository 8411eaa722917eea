#include "errors.hpp"

namespace txfeed::util {

ErrorKind ClassifyError(const std::exception& e) {
  if (dynamic_cast<const InvalidConfiguration*>(&e) || dynamic_cast<const InvalidFixture*>(&e)) {
    return ErrorKind::kConfiguration;
  }
  if (dynamic_cast<const InvalidRequest*>(&e)) {
    return ErrorKind::kInvalidRequest;
  }
  if (dynamic_cast<const MalformedTimestamp*>(&e)) {
    return ErrorKind::kMalformedData;
  }
  if (dynamic_cast<const MergeStalled*>(&e)) {
    return ErrorKind::kStall;
  }

  return ErrorKind::kStreamFailure;
}

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConfiguration:
      return "configuration";
    case ErrorKind::kInvalidRequest:
      return "invalid_request";
    case ErrorKind::kMalformedData:
      return "malformed_data";
    case ErrorKind::kStall:
      return "stall";
    case ErrorKind::kStreamFailure:
      return "stream_failure";
  }
  return "unknown";
}

} // namespace txfeed::util
