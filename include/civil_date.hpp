#pragma once
#include <optional>
#include <string>

struct CivilDate {
  int y = 0, m = 0, d = 0;
};

bool operator==(const CivilDate& a, const CivilDate& b);
bool operator!=(const CivilDate& a, const CivilDate& b);
bool operator<(const CivilDate& a, const CivilDate& b);

int days_in_month(int y, int m);
bool is_valid_date(int y, int m, int d);

// Validated construction; empty when (y, m, d) is not a real day in [1, 9999].
std::optional<CivilDate> make_date(int y, int m, int d);

// Reads only the first 10 chars as YYYY-MM-DD, so full timestamps work too.
std::optional<CivilDate> parse_iso_date(const std::string& s);

int weekday(const CivilDate& dt);               // 0=Monday .. 6=Sunday
CivilDate add_days(const CivilDate& dt, int delta);

std::string format_iso_date(const CivilDate& dt);   // YYYY-MM-DD
std::string format_basic_date(const CivilDate& dt); // YYYYMMDD

CivilDate today_local();
