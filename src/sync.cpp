#include "sync.hpp"
#include <stdexcept>

namespace {
void add_assignments(Calendar& cal, const Course& c, std::ostream* log) {
  for (auto& a : c.assignments) {
    if (a.due_at.empty()) continue;
    auto due = parse_timestamp(a.due_at);
    if (!due) {
      if (log) *log << "warning: skipping assignment '" << a.name << "': unreadable due_at "
                    << a.due_at << "\n";
      continue;
    }
    CalendarEvent e;
    e.summary = "📝 " + a.name + " (" + c.course_code + ")";
    e.start = *due;
    e.description = a.html_url;
    cal.add(std::move(e));
  }
}

void add_announcements(Calendar& cal, const Course& c, const DateInferenceEngine& engine,
                       const std::string& window_start, std::ostream* log) {
  for (auto& ann : c.announcements) {
    if (ann.posted_at.empty() || !(ann.posted_at > window_start)) continue;

    // title and body together, dates often hide in the message
    std::string text = ann.title + " " + ann.message;
    CivilDate when;
    try {
      when = engine.resolve(text, ann.posted_at, c.course_code);
    } catch (const std::invalid_argument& ex) {
      if (log) *log << "warning: skipping announcement '" << ann.title << "': " << ex.what() << "\n";
      continue;
    }

    CalendarEvent e;
    e.summary = "📢 " + ann.title + " (" + c.course_code + ")";
    e.start.date = when;
    e.all_day = true;
    e.description = "Originally Posted: " + ann.posted_at.substr(0, 10) + "\n" +
                    ann.html_url + "\n\n" + utf8_prefix(ann.message, 200) + "...";
    cal.add(std::move(e));
  }
}
}

std::string utf8_prefix(const std::string& s, size_t n) {
  size_t count = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (((unsigned char)s[i] & 0xC0) == 0x80) continue;
    if (count == n) return s.substr(0, i);
    ++count;
  }
  return s;
}

Calendar build_calendar(const Feed& feed, const DateInferenceEngine& engine,
                        const SyncOptions& opt) {
  Calendar cal;
  const std::string window_start = format_iso_date(add_days(opt.today, -opt.lookback_days));

  for (auto& c : feed.courses) {
    try {
      add_assignments(cal, c, opt.log);
      add_announcements(cal, c, engine, window_start, opt.log);
    } catch (const std::exception& ex) {
      if (opt.log) *opt.log << "warning: course " << c.course_code << " skipped: " << ex.what() << "\n";
    }
  }

  for (auto& item : feed.calendar_events) {
    auto start = parse_timestamp(item.start_at);
    if (!start) {
      if (opt.log) *opt.log << "warning: skipping calendar event '" << item.title
                            << "': unreadable start_at " << item.start_at << "\n";
      continue;
    }
    CalendarEvent e;
    e.summary = "🗓️ " + item.title;
    e.start = *start;
    cal.add(std::move(e));
  }
  return cal;
}
