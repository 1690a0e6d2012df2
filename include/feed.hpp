#pragma once
#include <string>
#include <vector>

struct Assignment {
  std::string name;
  std::string due_at;   // ISO timestamp, empty when undated
  std::string html_url;
};

struct Announcement {
  std::string title;
  std::string message;
  std::string posted_at;
  std::string html_url;
};

struct Course {
  std::string course_code;
  std::vector<Assignment> assignments;
  std::vector<Announcement> announcements;
};

struct CalendarItem {
  std::string title;
  std::string start_at;
};

// One LMS export: active courses plus the user's own calendar items.
struct Feed {
  std::vector<Course> courses;
  std::vector<CalendarItem> calendar_events;
};

Feed load_feed_json(const std::string& text);
Feed load_feed_file(const std::string& path);
