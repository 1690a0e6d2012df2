#pragma once
#include <stdexcept>
#include <string>

struct Args {
  std::string mode;          // "resolve" or "sync"
  std::string text;          // resolve: announcement text
  std::string posted;        // resolve: posted timestamp
  std::string course;        // resolve: course code
  std::string feed_path;     // sync: LMS export
  std::string out_path = "my_schedule.ics";
  std::string timetable_file; // overrides MY_TIMETABLE when set
  int lookback_days = 30;
};

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

extern const char* USAGE;

// Throws UsageError on bad arguments.
Args parse_cli(int argc, const char* const* argv);
