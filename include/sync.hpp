#pragma once
#include "calendar.hpp"
#include "date_inference.hpp"
#include "feed.hpp"
#include <iostream>
#include <string>

struct SyncOptions {
  int lookback_days = 30;       // announcements older than this are skipped
  CivilDate today = today_local();
  std::ostream* log = &std::cerr;
};

// First `n` code points of a UTF-8 string.
std::string utf8_prefix(const std::string& s, size_t n);

Calendar build_calendar(const Feed& feed, const DateInferenceEngine& engine,
                        const SyncOptions& opt = SyncOptions());
