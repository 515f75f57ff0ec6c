#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "kernel/Entity.h"

enum class EventType : std::uint8_t {
    Evidence = 0,       // an evidence record was created
    Supplanted,         // a belief changed value
    Forgotten,          // a belief fell back to the unknown marker
    Reinstated,         // a superseded value came back
    Distrusted,         // an owner caught a source lying
    COUNT
};

const char* eventTypeName(EventType type);

struct Event {
    EventType type = EventType::Evidence;
    std::uint64_t tick = 0;
    std::uint64_t eventNumber = 0;      // evidence that caused it, 0 when none
    std::uint8_t evidenceKind = 0;
    std::uint8_t feature = 0;
    EntityRef owner;                    // whose mind changed (belief events)
    EntityRef subject;
    EntityRef source;
    std::string value;
};

// Append-only record of what happened to evidence and beliefs during a run
class EventLog {
public:
    void logEvidence(std::uint64_t tick, std::uint64_t eventNumber, std::uint8_t kind,
                     EntityRef source, EntityRef subject);
    void logBeliefChange(EventType type, std::uint64_t tick, std::uint64_t eventNumber, EntityRef owner,
                         EntityRef subject, std::uint8_t feature, const std::string& value);
    void logDistrust(std::uint64_t tick, std::uint64_t eventNumber, EntityRef owner, EntityRef liar);

    const std::vector<Event>& events() const { return events_; }
    std::size_t size() const { return events_.size(); }
    std::size_t count(EventType type) const { return counts_[static_cast<std::size_t>(type)]; }
    std::vector<Event> recent(std::size_t n) const;

    void writeCsv(std::ostream& out) const;
    void clear();

private:
    void append(Event e);

    std::vector<Event> events_;
    std::array<std::size_t, static_cast<std::size_t>(EventType::COUNT)> counts_{};
};

#endif
