#include "schedule_index.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <ostream>

using ojson = nlohmann::ordered_json;

namespace {
bool to_weekdays(const ojson& v, std::vector<int>& out) {
  if (!v.is_array() || v.empty()) return false;
  out.clear();
  for (auto& x : v) {
    if (!x.is_number_integer()) return false;
    auto day = x.get<long long>();
    if (day < 0 || day > 6) return false;
    out.push_back((int)day);
  }
  return true;
}
}

ScheduleIndex::ScheduleIndex(ScheduleMap entries) : entries_(std::move(entries)) {
  for (auto& e : entries_) {
    auto& days = e.second;
    std::sort(days.begin(), days.end());
    days.erase(std::unique(days.begin(), days.end()), days.end());
  }
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [](const auto& e) { return e.second.empty(); }),
                 entries_.end());
}

ScheduleIndex ScheduleIndex::from_json(const std::string& text, std::ostream* log) {
  ojson j;
  try {
    j = ojson::parse(text);
  } catch (const ojson::parse_error&) {
    if (log) *log << "warning: could not parse timetable, check its JSON format\n";
    return ScheduleIndex();
  }
  if (!j.is_object()) {
    if (log) *log << "warning: timetable must be a JSON object, ignoring it\n";
    return ScheduleIndex();
  }

  ScheduleMap entries;
  for (auto it = j.begin(); it != j.end(); ++it) {
    std::vector<int> days;
    if (!to_weekdays(it.value(), days)) {
      if (log) *log << "warning: timetable entry '" << it.key()
                    << "' is not a list of weekdays 0-6, skipping\n";
      continue;
    }
    entries.emplace_back(it.key(), std::move(days));
  }
  return ScheduleIndex(std::move(entries));
}

ScheduleIndex ScheduleIndex::from_env(std::ostream* log, const char* var) {
  const char* raw = std::getenv(var);
  return from_json(raw ? raw : "{}", log);
}

const ScheduleMap::value_type* ScheduleIndex::find_entry(const std::string& course) const {
  for (auto& e : entries_) {
    if (course.find(e.first) != std::string::npos) return &e;
  }
  return nullptr;
}

std::optional<std::string> ScheduleIndex::find_key(const std::string& course) const {
  auto entry = find_entry(course);
  if (!entry) return std::nullopt;
  return entry->first;
}

std::optional<CivilDate> ScheduleIndex::next_class_after(const std::string& course,
                                                         const CivilDate& ref) const {
  if (entries_.empty()) return std::nullopt;

  auto entry = find_entry(course);
  if (!entry) return std::nullopt;
  const std::vector<int>* days = &entry->second;

  const int ref_day = weekday(ref);
  int ahead = 0;
  for (int day : *days) {
    if (day > ref_day) { ahead = day - ref_day; break; }
  }
  // nothing later this week: wrap to the first meeting of next week
  if (ahead == 0) ahead = (7 - ref_day) + days->front();

  return add_days(ref, ahead);
}
