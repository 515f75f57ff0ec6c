#include "utils/EventLog.h"

#include <ostream>

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::Evidence: return "evidence";
        case EventType::Supplanted: return "supplanted";
        case EventType::Forgotten: return "forgotten";
        case EventType::Reinstated: return "reinstated";
        case EventType::Distrusted: return "distrusted";
        case EventType::COUNT: break;
    }
    return "unknown";
}

void EventLog::logEvidence(std::uint64_t tick, std::uint64_t eventNumber, std::uint8_t kind,
                           EntityRef source, EntityRef subject) {
    Event e;
    e.type = EventType::Evidence;
    e.tick = tick;
    e.eventNumber = eventNumber;
    e.evidenceKind = kind;
    e.owner = source;
    e.source = source;
    e.subject = subject;
    append(std::move(e));
}

void EventLog::logBeliefChange(EventType type, std::uint64_t tick, std::uint64_t eventNumber, EntityRef owner,
                               EntityRef subject, std::uint8_t feature, const std::string& value) {
    Event e;
    e.type = type;
    e.tick = tick;
    e.eventNumber = eventNumber;
    e.feature = feature;
    e.owner = owner;
    e.subject = subject;
    e.source = owner;
    e.value = value;
    append(std::move(e));
}

void EventLog::logDistrust(std::uint64_t tick, std::uint64_t eventNumber, EntityRef owner, EntityRef liar) {
    Event e;
    e.type = EventType::Distrusted;
    e.tick = tick;
    e.eventNumber = eventNumber;
    e.owner = owner;
    e.subject = liar;
    e.source = liar;
    append(std::move(e));
}

std::vector<Event> EventLog::recent(std::size_t n) const {
    const std::size_t start = events_.size() > n ? events_.size() - n : 0;
    return std::vector<Event>(events_.begin() + static_cast<std::ptrdiff_t>(start), events_.end());
}

void EventLog::writeCsv(std::ostream& out) const {
    out << "tick,event_number,type,evidence_kind,feature,owner_kind,owner_id,subject_kind,subject_id,"
           "source_kind,source_id,value\n";
    for (const auto& e : events_) {
        out << e.tick << ',' << e.eventNumber << ',' << eventTypeName(e.type) << ','
            << static_cast<int>(e.evidenceKind) << ',' << static_cast<int>(e.feature) << ','
            << entityKindName(e.owner.kind) << ',' << e.owner.id << ','
            << entityKindName(e.subject.kind) << ',' << e.subject.id << ','
            << entityKindName(e.source.kind) << ',' << e.source.id << ','
            << '"' << e.value << '"' << '\n';
    }
}

void EventLog::clear() {
    events_.clear();
    counts_.fill(0);
}

void EventLog::append(Event e) {
    counts_[static_cast<std::size_t>(e.type)]++;
    events_.push_back(std::move(e));
}
