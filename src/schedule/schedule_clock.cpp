#include "schedule/schedule_clock.hpp"

namespace reportd::schedule {
namespace {

constexpr int kDaysToScan = 8;

}  // namespace

bool Trigger::IsValid() const {
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        return false;
    }
    if (weekday.has_value() && (weekday.value() < 1 || weekday.value() > 7)) {
        return false;
    }
    return true;
}

ScheduleClock::ScheduleClock(std::chrono::minutes utc_offset)
    : utc_offset_(utc_offset) {}

std::optional<utils::TimePoint> ScheduleClock::NextRun(const std::vector<Trigger>& triggers,
                                                       utils::TimePoint after) const {
    std::optional<utils::TimePoint> next;
    for (const auto& trigger : triggers) {
        const auto candidate = NextForTrigger(trigger, after);
        if (!candidate.has_value()) {
            continue;
        }
        if (!next.has_value() || candidate.value() < next.value()) {
            next = candidate;
        }
    }
    return next;
}

std::optional<utils::TimePoint> ScheduleClock::NextForTrigger(const Trigger& trigger,
                                                              utils::TimePoint after) const {
    if (!trigger.IsValid()) {
        return std::nullopt;
    }
    // Work on the wall clock of the configured offset, then shift back to UTC.
    const auto local_day = std::chrono::floor<std::chrono::days>(after + utc_offset_);
    for (int offset_days = 0; offset_days < kDaysToScan; ++offset_days) {
        const std::chrono::sys_days day{local_day + std::chrono::days(offset_days)};
        if (trigger.weekday.has_value()) {
            const std::chrono::weekday weekday{day};
            if (static_cast<int>(weekday.c_encoding()) + 1 != trigger.weekday.value()) {
                continue;
            }
        }
        const utils::TimePoint candidate =
            day + std::chrono::hours(trigger.hour) + std::chrono::minutes(trigger.minute) - utc_offset_;
        if (candidate > after) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace reportd::schedule
