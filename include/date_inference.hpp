#pragma once
#include "civil_date.hpp"
#include "schedule_index.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

enum class ResolutionOutcome { NextClass, ExplicitDate, Fallback };

const char* outcome_name(ResolutionOutcome o);

struct Resolution {
  CivilDate date;
  ResolutionOutcome outcome;
};

// Transient result of one explicit-date pattern.
struct ExplicitDateMatch {
  int day;
  std::string month;        // month token as written, e.g. "Sept"
  std::optional<int> year;
};

// Supplies the real-world "today" used for year inference.
using Clock = std::function<CivilDate()>;

std::optional<int> month_from_token(const std::string& token);

// Year for a month given without one: next year's occurrence when the month
// lies more than six months behind `today`.
int infer_year(int month, const CivilDate& today);

class DateInferenceEngine {
public:
  // `schedule` is held by reference and must outlive the engine.
  explicit DateInferenceEngine(const ScheduleIndex& schedule,
                               Clock clock = today_local,
                               std::ostream* log = &std::cerr);
  ~DateInferenceEngine();

  DateInferenceEngine(const DateInferenceEngine&) = delete;
  DateInferenceEngine& operator=(const DateInferenceEngine&) = delete;

  // Rule chain: "next class" via schedule, explicit date, then fallback.
  Resolution explain(const std::string& text, const CivilDate& fallback,
                     const std::string& course) const;

  CivilDate resolve(const std::string& text, const CivilDate& fallback,
                    const std::string& course) const;

  // Posted value is a timestamp whose first 10 chars are YYYY-MM-DD.
  // Throws std::invalid_argument when that prefix is not a date.
  CivilDate resolve(const std::string& text, const std::string& posted,
                    const std::string& course) const;

  bool mentions_next_class(const std::string& text) const;
  std::optional<ExplicitDateMatch> find_explicit_date(const std::string& text) const;

private:
  std::optional<CivilDate> explicit_date(const std::string& text) const;

  const ScheduleIndex& schedule_;
  Clock clock_;
  std::ostream* log_;
  // pimpl so RE2 stays out of the header
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
