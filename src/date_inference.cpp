#include "date_inference.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {
// [\s\p{Z}] so no-break spaces from rich-text bodies count as whitespace
const char* NEXT_PHRASE =
  R"(\b(next[\s\p{Z}]+class|next[\s\p{Z}]+lecture|next[\s\p{Z}]+session)\b)";

// Pattern A: "3rd Oct, 2024"
const char* DAY_FIRST =
  R"((\d{1,2})(?:st|nd|rd|th)?[\s\p{Z}]+(Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)[a-z]*[\s\p{Z}]*,?[\s\p{Z}]*(\d{4})?)";
// Pattern B: "Oct 3rd, 2024"
const char* MONTH_FIRST =
  R"((Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)[a-z]*[\s\p{Z}]+(\d{1,2})(?:st|nd|rd|th)?[\s\p{Z}]*,?[\s\p{Z}]*(\d{4})?)";

RE2::Options caseless() {
  RE2::Options o;
  o.set_case_sensitive(false);
  o.set_log_errors(false);
  return o;
}

std::optional<int> to_int(const std::string& s) {
  if (s.empty() || s.size() > 4) return std::nullopt;
  int v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + (c - '0');
  }
  return v;
}
}

enum class PatternOrder { DayFirst, MonthFirst };

struct DateInferenceEngine::Impl {
  RE2 next_phrase{ NEXT_PHRASE, caseless() };
  RE2 day_first{ DAY_FIRST, caseless() };
  RE2 month_first{ MONTH_FIRST, caseless() };

  struct Matcher {
    PatternOrder order;
    const RE2* re;
  };
  // tried in this order, first hit wins
  Matcher matchers[2] = {
    { PatternOrder::DayFirst, &day_first },
    { PatternOrder::MonthFirst, &month_first },
  };

  Impl() {
    if (!next_phrase.ok() || !day_first.ok() || !month_first.ok())
      throw std::logic_error("date inference: pattern failed to compile");
  }

  static std::optional<ExplicitDateMatch> run(const Matcher& m, const std::string& text) {
    std::string g1, g2, year_s;
    if (!RE2::PartialMatch(text, *m.re, &g1, &g2, &year_s)) return std::nullopt;

    const std::string& day_s = m.order == PatternOrder::DayFirst ? g1 : g2;
    const std::string& month_s = m.order == PatternOrder::DayFirst ? g2 : g1;
    auto day = to_int(day_s);
    if (!day) return std::nullopt;

    ExplicitDateMatch out{ *day, month_s, std::nullopt };
    if (!year_s.empty()) {
      auto year = to_int(year_s);
      if (!year) return std::nullopt;
      out.year = *year;
    }
    return out;
  }
};

const char* outcome_name(ResolutionOutcome o) {
  switch (o) {
    case ResolutionOutcome::NextClass: return "next-class";
    case ResolutionOutcome::ExplicitDate: return "explicit-date";
    case ResolutionOutcome::Fallback: return "fallback";
  }
  return "unknown";
}

std::optional<int> month_from_token(const std::string& token) {
  static const char* months[] = { "jan","feb","mar","apr","may","jun",
                                  "jul","aug","sep","oct","nov","dec" };
  std::string key = token.substr(0, 3);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  for (int i = 0; i < 12; ++i) {
    if (key == months[i]) return i + 1;
  }
  return std::nullopt;
}

int infer_year(int month, const CivilDate& today) {
  if (month < today.m && (today.m - month) > 6) return today.y + 1;
  return today.y;
}

DateInferenceEngine::DateInferenceEngine(const ScheduleIndex& schedule, Clock clock,
                                         std::ostream* log)
  : schedule_(schedule), clock_(std::move(clock)), log_(log), impl_(new Impl) {
  if (!clock_) clock_ = today_local;
}

DateInferenceEngine::~DateInferenceEngine() = default;

bool DateInferenceEngine::mentions_next_class(const std::string& text) const {
  return RE2::PartialMatch(text, impl_->next_phrase);
}

std::optional<ExplicitDateMatch>
DateInferenceEngine::find_explicit_date(const std::string& text) const {
  for (auto& m : impl_->matchers) {
    auto hit = Impl::run(m, text);
    if (hit) return hit;
  }
  return std::nullopt;
}

std::optional<CivilDate> DateInferenceEngine::explicit_date(const std::string& text) const {
  auto hit = find_explicit_date(text);
  if (!hit) return std::nullopt;

  auto month = month_from_token(hit->month);
  if (!month) return std::nullopt;

  int year = hit->year ? *hit->year : infer_year(*month, clock_());
  return make_date(year, *month, hit->day);
}

Resolution DateInferenceEngine::explain(const std::string& text, const CivilDate& fallback,
                                        const std::string& course) const {
  if (text.empty()) return { fallback, ResolutionOutcome::Fallback };

  if (mentions_next_class(text)) {
    auto next = schedule_.next_class_after(course, fallback);
    if (next) {
      if (log_) *log_ << "  found 'next class' in " << course << ": moved to "
                      << format_iso_date(*next) << "\n";
      return { *next, ResolutionOutcome::NextClass };
    }
  }

  auto explicit_hit = explicit_date(text);
  if (explicit_hit) return { *explicit_hit, ResolutionOutcome::ExplicitDate };

  return { fallback, ResolutionOutcome::Fallback };
}

CivilDate DateInferenceEngine::resolve(const std::string& text, const CivilDate& fallback,
                                       const std::string& course) const {
  return explain(text, fallback, course).date;
}

CivilDate DateInferenceEngine::resolve(const std::string& text, const std::string& posted,
                                       const std::string& course) const {
  auto fallback = parse_iso_date(posted);
  if (!fallback) throw std::invalid_argument("posted value is not YYYY-MM-DD: " + posted);
  return resolve(text, *fallback, course);
}
