#include "park/time/time_utils.hpp"

#include <cctype>
#include <cstdio>

namespace park {

namespace {

constexpr std::int64_t kMsPerDay = 86'400'000;

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's
// days_from_civil).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

CivilDate civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0),
                   m, d};
}

bool is_leap(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

// Reads exactly `width` digits starting at pos. Advances pos on success.
bool read_digits(const std::string& s, std::size_t& pos, std::size_t width,
                 int& out) {
  if (pos + width > s.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += width;
  out = value;
  return true;
}

bool expect(const std::string& s, std::size_t& pos, char c) {
  if (pos < s.size() && s[pos] == c) {
    ++pos;
    return true;
  }
  return false;
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if (a % b != 0 && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

}  // namespace

// -----------------------------------------------------------------------------
// parse_iso8601()
// -----------------------------------------------------------------------------
std::optional<Timestamp> parse_iso8601(const std::string& text) {
  std::size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int millis = 0;

  if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (!expect(text, pos, 'T') && !expect(text, pos, ' ')) {
    return std::nullopt;
  }
  if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !read_digits(text, pos, 2, minute)) {
    return std::nullopt;
  }
  if (expect(text, pos, ':')) {
    if (!read_digits(text, pos, 2, second)) {
      return std::nullopt;
    }
    if (expect(text, pos, '.')) {
      // Accept 1..9 fractional digits, keep millisecond precision.
      std::size_t digits = 0;
      int scale = 100;
      while (pos < text.size() &&
             std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (digits < 3) {
          millis += (text[pos] - '0') * scale;
          scale /= 10;
        }
        ++digits;
        ++pos;
      }
      if (digits == 0 || digits > 9) {
        return std::nullopt;
      }
    }
  }
  expect(text, pos, 'Z');
  if (pos != text.size()) {
    return std::nullopt;
  }

  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) >
          days_in_month(year, static_cast<unsigned>(month)) ||
      hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                            static_cast<unsigned>(day));
  const std::int64_t ms = days * kMsPerDay +
                          (static_cast<std::int64_t>(hour) * 3600 +
                           minute * 60 + second) * 1000 +
                          millis;
  return ms_to_timestamp(ms);
}

// -----------------------------------------------------------------------------
// format_iso8601()
// -----------------------------------------------------------------------------
std::string format_iso8601(Timestamp tp) {
  const std::int64_t ms = timestamp_to_ms(tp);
  const std::int64_t days = floor_div(ms, kMsPerDay);
  const std::int64_t ms_of_day = ms - days * kMsPerDay;
  const CivilDate date = civil_from_days(days);

  const int hour = static_cast<int>(ms_of_day / 3'600'000);
  const int minute = static_cast<int>((ms_of_day / 60'000) % 60);
  const int second = static_cast<int>((ms_of_day / 1000) % 60);
  const int millis = static_cast<int>(ms_of_day % 1000);

  char buf[40];
  if (millis != 0) {
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(date.year), date.month, date.day,
                  hour, minute, second, millis);
  } else {
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<long long>(date.year), date.month, date.day,
                  hour, minute, second);
  }
  return std::string(buf);
}

int utc_hour(Timestamp tp) {
  const std::int64_t ms = timestamp_to_ms(tp);
  const std::int64_t ms_of_day = ms - floor_div(ms, kMsPerDay) * kMsPerDay;
  return static_cast<int>(ms_of_day / 3'600'000);
}

int utc_weekday(Timestamp tp) {
  // 1970-01-01 was a Thursday (weekday 3 with Monday = 0).
  const std::int64_t days = floor_div(timestamp_to_ms(tp), kMsPerDay);
  return static_cast<int>(((days % 7) + 7 + 3) % 7);
}

Timestamp utc_day_start(Timestamp tp) {
  return ms_to_timestamp(floor_div(timestamp_to_ms(tp), kMsPerDay) *
                         kMsPerDay);
}

}  // namespace park
