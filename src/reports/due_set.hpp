#pragma once

#include <vector>

#include "reports/report_types.hpp"
#include "utils/common.hpp"

namespace reportd::reports {

// Enabled, non-empty schedule, nextRun at or before now.
bool IsDue(const ScheduledReport& report, utils::TimePoint now);

class DueSetResolver {
public:
    // Pure; keeps input order.
    std::vector<ScheduledReport> Resolve(const std::vector<ScheduledReport>& reports,
                                         utils::TimePoint now) const;
    std::size_t CountOverdue(const std::vector<ScheduledReport>& reports, utils::TimePoint now) const;
};

}  // namespace reportd::reports
