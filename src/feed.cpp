#include "feed.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
// missing and null fields both read as ""
std::string str_field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return "";
  if (!it->is_string()) throw std::runtime_error(std::string("feed: field '") + key + "' is not a string");
  return it->get<std::string>();
}

const json& array_field(const json& j, const char* key) {
  static const json empty = json::array();
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return empty;
  if (!it->is_array()) throw std::runtime_error(std::string("feed: field '") + key + "' is not an array");
  return *it;
}
}

Feed load_feed_json(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("feed: invalid JSON: ") + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("feed: top level must be an object");

  Feed f;
  for (auto& jc : array_field(j, "courses")) {
    Course c;
    c.course_code = str_field(jc, "course_code");
    for (auto& ja : array_field(jc, "assignments"))
      c.assignments.push_back({ str_field(ja, "name"), str_field(ja, "due_at"), str_field(ja, "html_url") });
    for (auto& jn : array_field(jc, "announcements"))
      c.announcements.push_back({ str_field(jn, "title"), str_field(jn, "message"),
                                  str_field(jn, "posted_at"), str_field(jn, "html_url") });
    f.courses.push_back(std::move(c));
  }
  for (auto& je : array_field(j, "calendar_events"))
    f.calendar_events.push_back({ str_field(je, "title"), str_field(je, "start_at") });
  return f;
}

Feed load_feed_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("feed: cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return load_feed_json(ss.str());
}
