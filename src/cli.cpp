#include "cli.hpp"
#include <string>

const char* USAGE =
"annocal resolve \"text\" --posted TIMESTAMP [--course CODE] [--timetable-file path]\n"
"annocal sync <export.json> [--out path] [--lookback-days N] [--timetable-file path]\n";

namespace {
int to_count(const std::string& flag, const std::string& v) {
  size_t used = 0;
  int n = 0;
  try {
    n = std::stoi(v, &used);
  } catch (const std::logic_error&) {
    throw UsageError("Bad number after " + flag + ": " + v);
  }
  if (used != v.size() || n < 0) throw UsageError("Bad number after " + flag + ": " + v);
  return n;
}
}

Args parse_cli(int argc, const char* const* argv) {
  Args a;
  if (argc < 2) throw UsageError("Missing mode");
  a.mode = argv[1];
  int i = 2;
  if (a.mode == "resolve") {
    if (i >= argc) throw UsageError("Missing text");
    a.text = argv[i++];
  } else if (a.mode == "sync") {
    if (i >= argc) throw UsageError("Missing export path");
    a.feed_path = argv[i++];
  } else {
    throw UsageError("Unknown mode: " + a.mode);
  }

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) throw UsageError("Missing value after " + f);
      dst = argv[i++];
    };
    if (f == "--posted" && a.mode == "resolve") next(a.posted);
    else if (f == "--course" && a.mode == "resolve") next(a.course);
    else if (f == "--out" && a.mode == "sync") next(a.out_path);
    else if (f == "--lookback-days" && a.mode == "sync") { std::string v; next(v); a.lookback_days = to_count(f, v); }
    else if (f == "--timetable-file") next(a.timetable_file);
    else throw UsageError("Unknown flag: " + f);
  }
  if (a.mode == "resolve" && a.posted.empty()) throw UsageError("resolve needs --posted");
  return a;
}
