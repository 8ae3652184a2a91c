#include "reports/due_set.hpp"

#include <algorithm>
#include <iterator>

namespace reportd::reports {

bool IsDue(const ScheduledReport& report, utils::TimePoint now) {
    if (!report.is_enabled || report.schedule.empty() || !report.next_run_ms.has_value()) {
        return false;
    }
    return report.next_run_ms.value() <= utils::ToMs(now);
}

std::vector<ScheduledReport> DueSetResolver::Resolve(const std::vector<ScheduledReport>& reports,
                                                     utils::TimePoint now) const {
    std::vector<ScheduledReport> due;
    std::copy_if(reports.begin(), reports.end(), std::back_inserter(due), [&](const ScheduledReport& report) {
        return IsDue(report, now);
    });
    return due;
}

std::size_t DueSetResolver::CountOverdue(const std::vector<ScheduledReport>& reports,
                                         utils::TimePoint now) const {
    return static_cast<std::size_t>(std::count_if(reports.begin(), reports.end(), [&](const ScheduledReport& report) {
        return IsDue(report, now);
    }));
}

}  // namespace reportd::reports
