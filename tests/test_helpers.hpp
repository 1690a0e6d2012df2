#pragma once

#include "civil_date.hpp"
#include "date_inference.hpp"
#include "schedule_index.hpp"

#include <ostream>
#include <string>

// readable failure messages for EXPECT_EQ on dates
inline void PrintTo(const CivilDate& d, std::ostream* os) {
    *os << format_iso_date(d);
}

// Pins the "current" date that year inference reads.
inline Clock fixed_clock(int y, int m, int d) {
    return [y, m, d]() { return CivilDate{y, m, d}; };
}

inline ScheduleIndex cs363_schedule() {
    return ScheduleIndex(ScheduleMap{{"CS 363", {1, 3}}});
}
