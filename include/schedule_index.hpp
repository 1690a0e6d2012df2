#pragma once
#include "civil_date.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// course-key -> weekday indices (0=Monday..6=Sunday), in configuration order
using ScheduleMap = std::vector<std::pair<std::string, std::vector<int>>>;

class ScheduleIndex {
public:
  ScheduleIndex() = default;
  explicit ScheduleIndex(ScheduleMap entries);

  // Malformed JSON yields an empty index and one warning on `log`.
  static ScheduleIndex from_json(const std::string& text, std::ostream* log);
  // Absent variable is treated as "{}".
  static ScheduleIndex from_env(std::ostream* log, const char* var = "MY_TIMETABLE");

  bool empty() const { return entries_.empty(); }
  size_t size() const { return entries_.size(); }

  // First stored key contained in `course`. Keys are tried in configuration
  // order, so overlapping keys ("CS 3" vs "CS 363") resolve to whichever
  // was configured first.
  std::optional<std::string> find_key(const std::string& course) const;

  // Next meeting strictly after `ref`; never returns `ref` itself.
  std::optional<CivilDate> next_class_after(const std::string& course,
                                            const CivilDate& ref) const;

private:
  const ScheduleMap::value_type* find_entry(const std::string& course) const;

  ScheduleMap entries_; // weekday lists kept sorted and unique
};
