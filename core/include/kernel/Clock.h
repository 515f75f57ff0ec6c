#ifndef CLOCK_H
#define CLOCK_H

#include <cstdint>
#include <string>

// Simulation clock: two timesteps per day (day, night) and the global event counter.
// Event numbers are handed out exactly once per evidence record and are strictly increasing
// across the whole run, so they order events that share a timestep.
class SimClock {
public:
    static constexpr int kDaysPerYear = 365;

    void reset(int startYear);
    void advance();
    void advanceDays(int days);

    std::uint64_t assignEventNumber() { return ++event_counter_; }
    std::uint64_t eventsAssigned() const { return event_counter_; }

    std::uint64_t ordinalDate() const { return ordinal_date_; }
    std::uint64_t tick() const { return tick_; }
    bool night() const { return night_; }
    int year() const { return static_cast<int>(ordinal_date_ / kDaysPerYear); }
    int dayOfYear() const { return static_cast<int>(ordinal_date_ % kDaysPerYear) + 1; }

    std::string dateString() const;

private:
    std::uint64_t ordinal_date_ = 0;
    std::uint64_t tick_ = 0;
    bool night_ = false;
    std::uint64_t event_counter_ = 0;
};

#endif
