#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "utils/common.hpp"

namespace reportd::schedule {

// weekday: 1 = Sunday ... 7 = Saturday; absent means every day.
struct Trigger {
    std::optional<int> weekday;
    int hour = 0;
    int minute = 0;

    bool IsValid() const;
};

class ScheduleClock {
public:
    explicit ScheduleClock(std::chrono::minutes utc_offset = std::chrono::minutes(0));

    // Earliest instant strictly after `after` matching any trigger.
    // nullopt when no valid trigger exists.
    std::optional<utils::TimePoint> NextRun(const std::vector<Trigger>& triggers,
                                            utils::TimePoint after) const;

    std::chrono::minutes utc_offset() const { return utc_offset_; }

private:
    std::optional<utils::TimePoint> NextForTrigger(const Trigger& trigger, utils::TimePoint after) const;

    std::chrono::minutes utc_offset_;
};

}  // namespace reportd::schedule
