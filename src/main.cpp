#include "cli.hpp"
#include "date_inference.hpp"
#include "feed.hpp"
#include "schedule_index.hpp"
#include "sync.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

static ScheduleIndex load_schedule(const Args& args) {
  if (args.timetable_file.empty()) return ScheduleIndex::from_env(&std::cerr);
  std::ifstream in(args.timetable_file, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open timetable " + args.timetable_file);
  std::ostringstream ss; ss << in.rdbuf();
  return ScheduleIndex::from_json(ss.str(), &std::cerr);
}

int main(int argc, char** argv) {
  Args args;
  try {
    args = parse_cli(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n" << USAGE;
    return 1;
  }

  try {
    const ScheduleIndex schedule = load_schedule(args);
    DateInferenceEngine engine(schedule);

    if (args.mode == "resolve") {
      auto fallback = parse_iso_date(args.posted);
      if (!fallback) throw std::invalid_argument("--posted is not YYYY-MM-DD: " + args.posted);
      auto r = engine.explain(args.text, *fallback, args.course);
      std::cout << format_iso_date(r.date) << " " << outcome_name(r.outcome) << "\n";
      return 0;
    }

    if (args.mode == "sync") {
      std::cerr << "Syncing...\n";
      Feed feed = load_feed_file(args.feed_path);
      SyncOptions opt;
      opt.lookback_days = args.lookback_days;
      Calendar cal = build_calendar(feed, engine, opt);
      cal.write_file(args.out_path, utc_stamp_now());
      std::cerr << "Wrote " << cal.size() << " events to " << args.out_path << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 1;
}
