#pragma once
#include "civil_date.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct CalendarTime {
  CivilDate date;
  bool has_time = false;
  int hh = 0, mm = 0, ss = 0;
  bool utc = false;
};

// Accepts YYYY-MM-DD or YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+00:00].
// Other UTC offsets are rejected rather than converted.
std::optional<CalendarTime> parse_timestamp(const std::string& s);

struct CalendarEvent {
  std::string uid;          // filled by Calendar::add when empty
  std::string summary;
  std::string description;
  CalendarTime start;
  bool all_day = false;
};

std::string escape_text(const std::string& s);
// Folds one content line at 75 octets, never inside a UTF-8 sequence.
std::string fold_line(const std::string& line);
std::string utc_stamp_now(); // YYYYMMDDTHHMMSSZ

class Calendar {
public:
  void add(CalendarEvent e);
  const std::vector<CalendarEvent>& events() const { return events_; }
  size_t size() const { return events_.size(); }

  std::string to_ics(const std::string& stamp) const;
  void write_file(const std::string& path, const std::string& stamp) const;

private:
  std::vector<CalendarEvent> events_;
  std::map<std::string, int> uid_uses_;
};
