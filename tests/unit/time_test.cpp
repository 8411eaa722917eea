#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using txfeed::util::MalformedTimestamp;
using txfeed::util::ParseTimestamp;
using txfeed::util::ToUnixSeconds;

std::int64_t Seconds(const std::string& text) {
  return ToUnixSeconds(ParseTimestamp(text));
}

bool Rejects(const std::string& text) {
  try {
    (void)ParseTimestamp(text);
  } catch (const MalformedTimestamp& e) {
    assert(e.raw_value() == text);
    return true;
  }
  return false;
}

void TestDateOnlyIsMidnightUtc() {
  assert(Seconds("2024-01-01") == 1704067200);
  assert(Seconds("1970-01-01") == 0);
}

void TestDateTimeVariants() {
  assert(Seconds("2024-05-29T17:26:40Z") == 1717003600);
  assert(Seconds("2024-05-29T17:26:40z") == 1717003600);
  assert(Seconds("2024-05-29 17:26:40Z") == 1717003600);
  assert(Seconds("2024-05-29T17:26:40") == 1717003600);
  assert(Seconds("2024-05-29T17:26") == 1717003560);
}

void TestFractionalSecondsAreFloored() {
  assert(Seconds("2024-05-29T17:26:40.999Z") == 1717003600);
  assert(Seconds("2024-05-29T17:26:40.1Z") == 1717003600);
  assert(Seconds("2024-05-29T17:26:40,500Z") == 1717003600);
  assert(Seconds("2024-05-29T17:26:40.123456789Z") == 1717003600);
  assert(Seconds("1970-01-01T00:00:00.999Z") == 0);
  // floor, not truncation toward zero
  assert(Seconds("1969-12-31T23:59:59.500Z") == -1);
}

void TestZoneOffsets() {
  assert(Seconds("2024-05-29T19:26:40+02:00") == 1717003600);
  assert(Seconds("2024-05-29T12:26:40-0500") == 1717003600);
  assert(Seconds("2024-05-29T17:26:40+00:00") == 1717003600);
  assert(Seconds("2024-01-01T00:30:00+01:00") == 1704067200 - 1800);
}

void TestLeapDays() {
  assert(Seconds("2024-02-29T12:00:00Z") == 1709208000);
  assert(Seconds("2000-02-29") == 951782400);
  assert(Rejects("2023-02-29"));
  assert(Rejects("1900-02-29"));
}

void TestMalformedInputsAreRejected() {
  assert(Rejects(""));
  assert(Rejects("yesterday"));
  assert(Rejects("2024-5-29"));
  assert(Rejects("2024-13-01"));
  assert(Rejects("2024-04-31"));
  assert(Rejects("2024-05-29T24:00:00Z"));
  assert(Rejects("2024-05-29T17:60:00Z"));
  assert(Rejects("2024-05-29T17:26:61Z"));
  assert(Rejects("2024-05-29T17"));
  assert(Rejects("2024-05-29T17:26:40."));
  assert(Rejects("2024-05-29T17:26:40.1234567890Z"));
  assert(Rejects("2024-05-29T17:26:40+2"));
  assert(Rejects("2024-05-29T17:26:40+24:00"));
  assert(Rejects("2024-05-29T17:26:40Z "));
  assert(Rejects(" 2024-05-29"));
  assert(Rejects("2024-05-29X"));
}

} // namespace

int main() {
  TestDateOnlyIsMidnightUtc();
  TestDateTimeVariants();
  TestFractionalSecondsAreFloored();
  TestZoneOffsets();
  TestLeapDays();
  TestMalformedInputsAreRejected();

  std::cout << "txfeed_unit_time: pass\n";
  return 0;
}
