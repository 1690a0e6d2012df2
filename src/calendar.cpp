#include "calendar.hpp"
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace {
bool read2(const std::string& s, size_t pos, int& out) {
  if (pos + 2 > s.size()) return false;
  if (s[pos] < '0' || s[pos] > '9' || s[pos+1] < '0' || s[pos+1] > '9') return false;
  out = (s[pos] - '0') * 10 + (s[pos+1] - '0');
  return true;
}

std::string hex64(uint64_t v) {
  char buf[20];
  std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)v);
  return buf;
}

uint64_t fnv1a(const std::string& s) {
  uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : s) { h ^= c; h *= 1099511628211ULL; }
  return h;
}

std::string format_time(const CalendarTime& t) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%sT%02d%02d%02d%s", format_basic_date(t.date).c_str(),
                t.hh, t.mm, t.ss, t.utc ? "Z" : "");
  return buf;
}

std::string start_key(const CalendarTime& t) {
  return t.has_time ? format_time(t) : format_basic_date(t.date);
}
}

std::optional<CalendarTime> parse_timestamp(const std::string& s) {
  auto date = parse_iso_date(s);
  if (!date) return std::nullopt;
  CalendarTime t;
  t.date = *date;
  if (s.size() == 10) return t;

  if (s[10] != 'T' && s[10] != ' ') return std::nullopt;
  if (!read2(s, 11, t.hh) || s.size() < 16 || s[13] != ':' || !read2(s, 14, t.mm))
    return std::nullopt;
  size_t pos = 16;
  if (pos < s.size() && s[pos] == ':') {
    if (!read2(s, pos + 1, t.ss)) return std::nullopt;
    pos += 3;
    if (pos < s.size() && s[pos] == '.') {
      ++pos;
      while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
    }
  }
  if (t.hh > 23 || t.mm > 59 || t.ss > 60) return std::nullopt;

  std::string zone = s.substr(pos);
  if (zone == "Z" || zone == "+00:00") t.utc = true;
  else if (!zone.empty()) return std::nullopt;
  t.has_time = true;
  return t;
}

std::string escape_text(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case ';':  out += "\\;"; break;
      case ',':  out += "\\,"; break;
      case '\n': out += "\\n"; break;
      case '\r': break;
      default:   out += c;
    }
  }
  return out;
}

std::string fold_line(const std::string& line) {
  std::string out;
  size_t pos = 0;
  size_t limit = 75;
  while (line.size() - pos > limit) {
    size_t cut = pos + limit;
    while (cut > pos && ((unsigned char)line[cut] & 0xC0) == 0x80) --cut;
    out.append(line, pos, cut - pos);
    out += "\r\n ";
    pos = cut;
    limit = 74; // leading space counts toward the 75
  }
  out.append(line, pos, std::string::npos);
  out += "\r\n";
  return out;
}

std::string utc_stamp_now() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[24];
  std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
  return buf;
}

void Calendar::add(CalendarEvent e) {
  if (e.uid.empty()) {
    std::string base = hex64(fnv1a(e.summary + "|" + start_key(e.start)));
    int n = ++uid_uses_[base];
    e.uid = base + (n > 1 ? "-" + std::to_string(n) : "") + "@annocal";
  }
  events_.push_back(std::move(e));
}

std::string Calendar::to_ics(const std::string& stamp) const {
  std::string out;
  out += fold_line("BEGIN:VCALENDAR");
  out += fold_line("VERSION:2.0");
  out += fold_line("PRODID:-//annocal//announcement calendar//EN");
  for (auto& e : events_) {
    out += fold_line("BEGIN:VEVENT");
    out += fold_line("UID:" + e.uid);
    out += fold_line("DTSTAMP:" + stamp);
    out += fold_line("SUMMARY:" + escape_text(e.summary));
    if (e.all_day || !e.start.has_time) {
      out += fold_line("DTSTART;VALUE=DATE:" + format_basic_date(e.start.date));
      out += fold_line("DTEND;VALUE=DATE:" + format_basic_date(add_days(e.start.date, 1)));
    } else {
      out += fold_line("DTSTART:" + format_time(e.start));
    }
    if (!e.description.empty())
      out += fold_line("DESCRIPTION:" + escape_text(e.description));
    out += fold_line("END:VEVENT");
  }
  out += fold_line("END:VCALENDAR");
  return out;
}

void Calendar::write_file(const std::string& path, const std::string& stamp) const {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) throw std::runtime_error("calendar: cannot open " + path);
  std::string data = to_ics(stamp);
  f.write(data.data(), (std::streamsize)data.size());
  if (!f) throw std::runtime_error("calendar: write failed for " + path);
}
