#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>

namespace {
std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

void writeEntity(std::ostream& os, const Kernel& kernel, EntityRef e) {
    os << "{\"kind\":\"" << entityKindName(e.kind) << "\",\"id\":" << e.id << ",\"name\":\""
       << escape(kernel.entityName(e)) << "\"}";
}
}

std::string kernelToJson(const Kernel& kernel, bool includePeople) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    auto m = kernel.computeMetrics();

    os << "{";
    os << "\"generation\":" << kernel.generation() << ",";
    os << "\"date\":\"" << kernel.clock().dateString() << "\",";
    os << "\"metrics\":{";
    os << "\"facets\":" << m.facets << ",";
    os << "\"knownFacets\":" << m.knownFacets << ",";
    os << "\"accurateShare\":" << m.accurateShare << ",";
    os << "\"forgottenShare\":" << m.forgottenShare << ",";
    os << "\"meanStrength\":" << m.meanStrength << ",";
    os << "\"evidence\":" << m.evidence << ",";
    os << "\"distrustPairs\":" << m.distrustPairs;
    os << "}";

    if (includePeople) {
        os << ",\"people\":[";
        const auto& people = kernel.people();
        for (std::size_t i = 0; i < people.size(); ++i) {
            const auto& p = people[i];
            os << "{";
            os << "\"id\":" << p.id << ",";
            os << "\"name\":\"" << escape(p.name()) << "\",";
            os << "\"age\":" << p.age << ",";
            os << "\"location\":" << p.location << ",";
            os << "\"models\":" << kernel.mind(p.id).modelCount() << ",";
            os << "\"facets\":" << kernel.mind(p.id).allFacets().size();
            os << "}";
            if (i + 1 < people.size()) os << ",";
        }
        os << "]";
    }
    os << "}";

    return os.str();
}

std::string mindToJson(const Kernel& kernel, std::uint32_t owner) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);
    const Mind& mind = kernel.mind(owner);

    os << "{\"owner\":";
    writeEntity(os, kernel, mind.owner());
    os << ",\"memory\":" << mind.memory();

    os << ",\"distrusted\":[";
    bool first = true;
    for (EntityRef liar : mind.distrusted()) {
        if (!first) os << ",";
        first = false;
        os << liar.id;
    }
    os << "]";

    os << ",\"models\":[";
    const auto subjects = mind.knownSubjects();
    for (std::size_t i = 0; i < subjects.size(); ++i) {
        const MentalModel* model = mind.model(subjects[i]);
        os << "{\"subject\":";
        writeEntity(os, kernel, subjects[i]);
        os << ",\"salience\":" << mind.salience().of(subjects[i]);
        os << ",\"facets\":[";
        bool firstFacet = true;
        for (const auto& [feature, facet] : model->facets()) {
            if (!firstFacet) os << ",";
            firstFacet = false;
            os << "{";
            os << "\"feature\":\"" << featureName(feature) << "\",";
            os << "\"value\":\"" << escape(facet->value()) << "\",";
            os << "\"strength\":" << facet->strength() << ",";
            os << "\"accurate\":" << (facet->accurate(kernel) ? "true" : "false") << ",";
            os << "\"evidence\":" << facet->evidence().size() << ",";
            os << "\"sources\":[";
            const auto sources = facet->sources();
            for (std::size_t s = 0; s < sources.size(); ++s) {
                os << sources[s].id;
                if (s + 1 < sources.size()) os << ",";
            }
            os << "]}";
        }
        os << "]}";
        if (i + 1 < subjects.size()) os << ",";
    }
    os << "]}";
    return os.str();
}

void writeMetricsHeader(std::ostream& out) {
    out << "generation,facets,known_facets,accurate_share,forgotten_share,mean_strength,evidence,distrust_pairs\n";
}

void logMetrics(const Kernel& kernel, std::ostream& out) {
    auto m = kernel.computeMetrics();
    out << kernel.generation() << ","
        << m.facets << ","
        << m.knownFacets << ","
        << m.accurateShare << ","
        << m.forgottenShare << ","
        << m.meanStrength << ","
        << m.evidence << ","
        << m.distrustPairs << "\n";
}
