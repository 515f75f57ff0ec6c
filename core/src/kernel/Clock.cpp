#include "kernel/Clock.h"

#include <sstream>

void SimClock::reset(int startYear) {
    ordinal_date_ = static_cast<std::uint64_t>(startYear) * kDaysPerYear;
    tick_ = 0;
    night_ = false;
    event_counter_ = 0;
}

void SimClock::advance() {
    ++tick_;
    if (night_) {
        night_ = false;
        ++ordinal_date_;
    } else {
        night_ = true;
    }
}

// Low-fidelity skip: whole days pass, the event counter is untouched
void SimClock::advanceDays(int days) {
    if (days <= 0) {
        return;
    }
    ordinal_date_ += static_cast<std::uint64_t>(days);
    tick_ += static_cast<std::uint64_t>(days) * 2;
}

std::string SimClock::dateString() const {
    std::ostringstream os;
    os << (night_ ? "night" : "day") << " of day " << dayOfYear() << ", " << year();
    return os.str();
}
