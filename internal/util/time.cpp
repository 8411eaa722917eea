#include "time.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace txfeed::util {

namespace {

class Cursor {
 public:
  explicit Cursor(std::string_view text) : text_(text) {
  }

  bool AtEnd() const {
    return pos_ == text_.size();
  }

  bool Consume(char c) {
    if (AtEnd() || text_[pos_] != c) return false;
    ++pos_;
    return true;
  }

  bool ConsumeAny(std::string_view chars) {
    if (AtEnd() || chars.find(text_[pos_]) == std::string_view::npos) return false;
    ++pos_;
    return true;
  }

  char Peek() const {
    return AtEnd() ? '\0' : text_[pos_];
  }

  // Reads exactly `count` decimal digits.
  bool Digits(std::size_t count, int& out) {
    if (text_.size() - pos_ < count) return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
      const char c = text_[pos_ + i];
      if (c < '0' || c > '9') return false;
      value = value * 10 + (c - '0');
    }
    pos_ += count;
    out = value;
    return true;
  }

  // Fractional seconds: keeps millisecond precision, truncates the rest.
  bool FractionMillis(int& out) {
    std::size_t digits = 0;
    int         millis = 0;
    while (!AtEnd() && text_[pos_] >= '0' && text_[pos_] <= '9') {
      if (digits < 3) millis = millis * 10 + (text_[pos_] - '0');
      ++digits;
      ++pos_;
    }
    if (digits == 0 || digits > 9) return false;
    for (std::size_t i = digits; i < 3; ++i) millis *= 10;
    out = millis;
    return true;
  }

 private:
  std::string_view text_;
  std::size_t      pos_ = 0;
};

[[noreturn]] void Malformed(std::string_view text, const char* reason) {
  throw MalformedTimestamp(std::string("malformed timestamp (") + reason + ")", std::string(text));
}

} // namespace

TimePoint ParseTimestamp(std::string_view text) {
  using namespace std::chrono;

  Cursor cur(text);

  int y = 0, mo = 0, d = 0;
  if (!cur.Digits(4, y) || !cur.Consume('-') || !cur.Digits(2, mo) || !cur.Consume('-') || !cur.Digits(2, d)) {
    Malformed(text, "expected YYYY-MM-DD");
  }

  const year_month_day date{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!date.ok()) {
    Malformed(text, "calendar date out of range");
  }

  TimePoint tp = sys_days{date};
  if (cur.AtEnd()) {
    return tp;
  }

  int h = 0, mi = 0, s = 0, ms = 0;
  if (!cur.ConsumeAny("Tt ") || !cur.Digits(2, h) || !cur.Consume(':') || !cur.Digits(2, mi)) {
    Malformed(text, "expected HH:MM after date");
  }
  if (cur.Consume(':') && !cur.Digits(2, s)) {
    Malformed(text, "expected seconds");
  }
  if (cur.ConsumeAny(".,") && !cur.FractionMillis(ms)) {
    Malformed(text, "expected 1 to 9 fractional digits");
  }
  if (h > 23 || mi > 59 || s > 59) {
    Malformed(text, "time of day out of range");
  }

  minutes offset{0};
  if (cur.ConsumeAny("Zz")) {
    // UTC
  } else if (cur.Peek() == '+' || cur.Peek() == '-') {
    const bool negative = cur.Peek() == '-';
    cur.ConsumeAny("+-");
    int oh = 0, om = 0;
    if (!cur.Digits(2, oh)) {
      Malformed(text, "expected zone offset hours");
    }
    cur.Consume(':');
    if (!cur.Digits(2, om)) {
      Malformed(text, "expected zone offset minutes");
    }
    if (oh > 23 || om > 59) {
      Malformed(text, "zone offset out of range");
    }
    offset = hours{oh} + minutes{om};
    if (negative) offset = -offset;
  }

  if (!cur.AtEnd()) {
    Malformed(text, "unexpected trailing characters");
  }

  tp += hours{h} + minutes{mi} + seconds{s} + milliseconds{ms};
  return tp - offset;
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp).time_since_epoch().count();
}

} // namespace txfeed::util
