#include "civil_date.hpp"
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace {
// Day counts relative to 1970-01-01, proleptic Gregorian.
int64_t days_from_civil(int y, int m, int d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t z) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int d = (int)(doy - (153 * mp + 2) / 5 + 1);
  const int m = (int)(mp < 10 ? mp + 3 : mp - 9);
  const int y = (int)(yoe + era * 400) + (m <= 2);
  return CivilDate{ y, m, d };
}

bool is_leap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

bool read_digits(const std::string& s, size_t pos, size_t n, int& out) {
  int v = 0;
  for (size_t i = pos; i < pos + n; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}
}

bool operator==(const CivilDate& a, const CivilDate& b) {
  return a.y == b.y && a.m == b.m && a.d == b.d;
}

bool operator!=(const CivilDate& a, const CivilDate& b) { return !(a == b); }

bool operator<(const CivilDate& a, const CivilDate& b) {
  if (a.y != b.y) return a.y < b.y;
  if (a.m != b.m) return a.m < b.m;
  return a.d < b.d;
}

int days_in_month(int y, int m) {
  static const int table[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m < 1 || m > 12) return 0;
  if (m == 2 && is_leap(y)) return 29;
  return table[m - 1];
}

bool is_valid_date(int y, int m, int d) {
  if (y < 1 || y > 9999) return false;
  if (m < 1 || m > 12) return false;
  return d >= 1 && d <= days_in_month(y, m);
}

std::optional<CivilDate> make_date(int y, int m, int d) {
  if (!is_valid_date(y, m, d)) return std::nullopt;
  return CivilDate{ y, m, d };
}

std::optional<CivilDate> parse_iso_date(const std::string& s) {
  if (s.size() < 10) return std::nullopt;
  if (s[4] != '-' || s[7] != '-') return std::nullopt;
  int y = 0, m = 0, d = 0;
  if (!read_digits(s, 0, 4, y) || !read_digits(s, 5, 2, m) || !read_digits(s, 8, 2, d))
    return std::nullopt;
  return make_date(y, m, d);
}

int weekday(const CivilDate& dt) {
  // 1970-01-01 was a Thursday (index 3)
  const int64_t z = days_from_civil(dt.y, dt.m, dt.d);
  return (int)(((z % 7) + 7 + 3) % 7);
}

CivilDate add_days(const CivilDate& dt, int delta) {
  return civil_from_days(days_from_civil(dt.y, dt.m, dt.d) + delta);
}

std::string format_iso_date(const CivilDate& dt) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", dt.y, dt.m, dt.d);
  return buf;
}

std::string format_basic_date(const CivilDate& dt) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d", dt.y, dt.m, dt.d);
  return buf;
}

CivilDate today_local() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  return CivilDate{ tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday };
}
