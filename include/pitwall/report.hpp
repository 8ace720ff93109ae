#pragma once
#include <string>
#include <pitwall/session.hpp>

namespace pitwall {

// Plain-text end-of-run report; InsufficientData fields print as "--".
std::string format_report(const SessionSummary& sum, const SessionAnalysis& a);

// One line: "lap 12 pit_now/critical: fuel for 1.8 laps, 2 needed"
std::string format_recommendation(int lap, const StrategyRecommendation& r);

} // namespace pitwall
