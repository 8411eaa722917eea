#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace txfeed::util {

/*
  Central error types.

  The CLI translates these into process exit codes via ClassifyError.
*/

class InvalidConfiguration : public std::runtime_error {
 public:
  explicit InvalidConfiguration(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidRequest : public std::runtime_error {
 public:
  explicit InvalidRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedTimestamp : public std::runtime_error {
 public:
  MalformedTimestamp(const std::string& msg, std::string raw_value)
      : std::runtime_error(msg + ": '" + raw_value + "'"), raw_value_(std::move(raw_value)) {
  }

  const std::string& raw_value() const noexcept {
    return raw_value_;
  }

 private:
  std::string raw_value_;
};

class MergeStalled : public std::runtime_error {
 public:
  explicit MergeStalled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidFixture : public std::runtime_error {
 public:
  explicit InvalidFixture(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class ErrorKind {
  kConfiguration,
  kInvalidRequest,
  kMalformedData,
  kStall,
  kStreamFailure,
};

ErrorKind        ClassifyError(const std::exception& e);
std::string_view ToString(ErrorKind kind);

} // namespace txfeed::util
