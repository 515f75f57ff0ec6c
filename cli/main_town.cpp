#include "kernel/Kernel.h"
#include "io/Snapshot.h"
#include "utils/Validation.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <filesystem>
#include <cstdlib>

static void printHelp() {
    std::cerr << "Town Commands:\n"
              << "  step N                        # advance N timesteps (two per day)\n"
              << "  skip D                        # fast-forward D days at low fidelity\n"
              << "  state [people]                # print JSON snapshot (optional: include people)\n"
              << "  metrics                       # print current epistemic metrics\n"
              << "  reset [SEED]                  # rebuild the town, optionally with a new seed\n"
              << "  run T log                     # run T timesteps, log metrics every 'log' steps\n"
              << "  person ID                     # show a person's ground truth\n"
              << "  place ID                      # show a place\n"
              << "  belief OWNER ENTITY FEATURE   # what OWNER believes about ENTITY's FEATURE\n"
              << "  sources OWNER ENTITY [FEATURE]# who OWNER heard it from, most frequent first\n"
              << "  why OWNER ENTITY FEATURE      # the evidence trail behind a belief\n"
              << "  lie A B ENTITY FEATURE VALUE  # A tells B a lie\n"
              << "  mind ID                       # print JSON dump of a mind\n"
              << "  events N                      # show the last N logged events\n"
              << "  eventlog FILE                 # write the event log as CSV\n"
              << "  quit                          # exit\n"
              << "\nEntities: p<ID> person (or a bare ID), r<ID> residence, b<ID> business.\n"
              << "Features use underscores for spaces, e.g. hair_color.\n"
              << "\nOptions: --seed=N --population=N --places=N, or HEARSAY_SEED env var for the seed\n";
}

static std::optional<FeatureType> parseFeature(std::string token) {
    std::replace(token.begin(), token.end(), '_', ' ');
    return FeatureRegistry::instance().fromName(token);
}

static std::string describeBelief(const std::optional<std::string>& value) {
    if (!value) return "(no belief)";
    if (value->empty()) return "(forgotten)";
    return *value;
}

int main(int argc, char** argv) {
    KernelConfig cfg;

    if (const char* envSeed = std::getenv("HEARSAY_SEED")) {
        cfg.seed = std::strtoull(envSeed, nullptr, 10);
    }

    const char* scriptArg = nullptr;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--seed=", 0) == 0) {
            cfg.seed = std::strtoull(arg.substr(7).c_str(), nullptr, 10);
        } else if (arg.rfind("--population=", 0) == 0) {
            cfg.population = static_cast<std::uint32_t>(std::strtoul(arg.substr(13).c_str(), nullptr, 10));
        } else if (arg.rfind("--places=", 0) == 0) {
            const auto places = static_cast<std::uint32_t>(std::strtoul(arg.substr(9).c_str(), nullptr, 10));
            cfg.businesses = places / 5;
            cfg.residences = places - cfg.businesses;
        } else if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            scriptArg = argv[i];
            break;
        }
    }

    try {
        validateConfig(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    Kernel kernel(cfg);

    // Check if there's a script file argument
    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        // Interactive mode
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }

        try {
        if (cmd == "step") {
            int n = 1;
            iss >> n;
            if (n < 1) n = 1;
            for (int i = 0; i < n; ++i) {
                kernel.step();
                if ((i + 1) % 100 == 0 || i == n - 1) {
                    std::cerr << "Tick " << (i + 1) << "/" << n << "\r";
                    std::cerr.flush();
                }
            }
            std::cerr << "\n";
            std::cout << kernelToJson(kernel) << "\n";
            std::cout.flush();

        } else if (cmd == "skip") {
            int days = 1;
            if (!(iss >> days)) days = 1;
            kernel.fastForward(days);
            std::cout << "Skipped to " << kernel.clock().dateString() << "\n";

        } else if (cmd == "state") {
            std::string opt;
            iss >> opt;
            std::cout << kernelToJson(kernel, opt == "people") << "\n";
            std::cout.flush();

        } else if (cmd == "metrics") {
            auto m = kernel.computeMetrics();
            std::cout << std::fixed << std::setprecision(3)
                      << "Generation: " << kernel.generation() << " (" << kernel.clock().dateString() << ")\n"
                      << "People: " << m.people << "\n"
                      << "Facets: " << m.facets << " (" << m.knownFacets << " known)\n"
                      << "Accurate share: " << m.accurateShare << "\n"
                      << "Forgotten share: " << m.forgottenShare << "\n"
                      << "Mean strength: " << m.meanStrength << "\n"
                      << "Evidence records: " << m.evidence << "\n"
                      << "Distrusted sources: " << m.distrustPairs << "\n";
            std::cout.flush();

        } else if (cmd == "reset") {
            std::uint64_t seed = 0;
            if (iss >> seed) {
                cfg.seed = seed;
            }
            kernel.reset(cfg);
            std::cout << "Reset: " << cfg.population << " people, " << cfg.residences << " residences, "
                      << cfg.businesses << " businesses (seed=" << cfg.seed << ")\n";
            std::cout.flush();

        } else if (cmd == "run") {
            int ticks = 0, log_freq = 1;
            iss >> ticks >> log_freq;
            if (log_freq < 1) log_freq = 1;

            bool isNewFile = !std::filesystem::exists("metrics.csv");
            std::ofstream metricsFile("metrics.csv", std::ios::app);
            if (isNewFile) {
                writeMetricsHeader(metricsFile);
            }

            for (int t = 0; t < ticks; ++t) {
                kernel.step();
                if ((t + 1) % 100 == 0 || t == ticks - 1) {
                    std::cerr << "Tick " << (t + 1) << "/" << ticks << "\r";
                    std::cerr.flush();
                }
                if (t % log_freq == 0 || t == ticks - 1) {
                    logMetrics(kernel, metricsFile);
                }
            }
            std::cerr << "\n";
            std::cout << "Ran " << ticks << " timesteps, metrics appended to metrics.csv\n";

        } else if (cmd == "person") {
            std::uint32_t id;
            if (!(iss >> id)) {
                std::cerr << "Usage: person ID\n";
                continue;
            }
            const Person& p = kernel.person(id);
            const EntityRef ref = personRef(id);
            std::cout << "\n=== " << p.name() << " (#" << p.id << ") ===\n";
            for (FeatureType f : FeatureRegistry::instance().featuresFor(EntityKind::Person)) {
                std::cout << "  " << std::left << std::setw(20) << featureName(f) << kernel.trueFeature(ref, f) << "\n";
            }
            std::cout << "  Location: " << (p.location >= 0 ? kernel.place(static_cast<std::uint32_t>(p.location)).name
                                                           : std::string("nowhere")) << "\n";
            std::cout << "  Memory: " << std::setprecision(2) << p.memory << "\n";
            std::cout.flush();

        } else if (cmd == "place") {
            std::uint32_t id;
            if (!(iss >> id)) {
                std::cerr << "Usage: place ID\n";
                continue;
            }
            const Place& pl = kernel.place(id);
            std::cout << pl.name << " [" << entityKindName(pl.kind) << "] " << pl.address << ", block " << pl.block
                      << ", " << kernel.occupants(id).size() << " present\n";

        } else if (cmd == "belief" || cmd == "why") {
            std::uint32_t owner;
            std::string entityTok, featureTok;
            if (!(iss >> owner >> entityTok >> featureTok)) {
                std::cerr << "Usage: " << cmd << " OWNER ENTITY FEATURE\n";
                continue;
            }
            auto subject = kernel.entityFromToken(entityTok);
            auto feature = parseFeature(featureTok);
            if (!subject || !feature) {
                std::cerr << "Unknown entity or feature\n";
                continue;
            }
            auto value = kernel.belief(owner, *subject, *feature);
            std::cout << kernel.entityName(personRef(owner)) << " believes " << kernel.entityName(*subject) << "'s "
                      << featureName(*feature) << " is " << describeBelief(value);
            if (value && !value->empty()) {
                std::cout << (kernel.accurateBelief(owner, *subject, *feature) ? " (accurate)" : " (inaccurate)");
            }
            std::cout << "\n";

            if (cmd == "why") {
                const BeliefFacet* facet = kernel.mind(owner).facet(*subject, *feature);
                if (facet) {
                    std::cout << "  strength " << std::fixed << std::setprecision(2) << facet->strength() << "\n";
                    for (const auto& fe : facet->evidence()) {
                        std::cout << "  #" << fe.evidence->eventNumber() << " " << ingestOutcomeName(fe.outcome)
                                  << " '" << fe.proposedValue << "': " << describe(*fe.evidence, kernel) << "\n";
                    }
                }
            }
            std::cout.flush();

        } else if (cmd == "sources") {
            std::uint32_t owner;
            std::string entityTok, featureTok;
            if (!(iss >> owner >> entityTok)) {
                std::cerr << "Usage: sources OWNER ENTITY [FEATURE]\n";
                continue;
            }
            auto subject = kernel.entityFromToken(entityTok);
            std::optional<FeatureType> feature;
            if (iss >> featureTok) {
                feature = parseFeature(featureTok);
                if (!feature) {
                    std::cerr << "Unknown feature: " << featureTok << "\n";
                    continue;
                }
            }
            if (!subject) {
                std::cerr << "Unknown entity: " << entityTok << "\n";
                continue;
            }
            for (EntityRef source : kernel.sources(owner, *subject, feature)) {
                std::cout << "  " << kernel.entityName(source) << " (#" << source.id << ")\n";
            }
            std::cout.flush();

        } else if (cmd == "lie") {
            std::uint32_t liar, recipient;
            std::string entityTok, featureTok, value;
            if (!(iss >> liar >> recipient >> entityTok >> featureTok) || !std::getline(iss >> std::ws, value)) {
                std::cerr << "Usage: lie A B ENTITY FEATURE VALUE\n";
                continue;
            }
            auto subject = kernel.entityFromToken(entityTok);
            auto feature = parseFeature(featureTok);
            if (!subject || !feature) {
                std::cerr << "Unknown entity or feature\n";
                continue;
            }
            kernel.tellLie(liar, recipient, *subject, *feature, value);
            std::cout << kernel.entityName(personRef(recipient)) << " now believes "
                      << describeBelief(kernel.belief(recipient, *subject, *feature)) << "\n";

        } else if (cmd == "mind") {
            std::uint32_t id;
            if (!(iss >> id)) {
                std::cerr << "Usage: mind ID\n";
                continue;
            }
            std::cout << mindToJson(kernel, id) << "\n";
            std::cout.flush();

        } else if (cmd == "events") {
            std::size_t n = 20;
            if (!(iss >> n)) n = 20;
            for (const auto& e : kernel.eventLog().recent(n)) {
                std::cout << "  t" << e.tick << " #" << e.eventNumber << " " << eventTypeName(e.type);
                if (e.type == EventType::Evidence) {
                    std::cout << " " << evidenceKindName(static_cast<EvidenceKind>(e.evidenceKind)) << " by "
                              << kernel.entityName(e.source) << " about " << kernel.entityName(e.subject);
                } else if (e.type == EventType::Distrusted) {
                    std::cout << " " << kernel.entityName(e.owner) << " distrusts " << kernel.entityName(e.source);
                } else {
                    std::cout << " " << kernel.entityName(e.owner) << ": " << kernel.entityName(e.subject) << "'s "
                              << featureName(static_cast<FeatureType>(e.feature)) << " -> '" << e.value << "'";
                }
                std::cout << "\n";
            }
            std::cout.flush();

        } else if (cmd == "eventlog") {
            std::string path;
            if (!(iss >> path)) {
                std::cerr << "Usage: eventlog FILE\n";
                continue;
            }
            std::ofstream out(path);
            if (!out.is_open()) {
                std::cerr << "Error: Could not open '" << path << "' for writing\n";
                continue;
            }
            kernel.eventLog().writeCsv(out);
            std::cout << "Wrote " << kernel.eventLog().size() << " events to " << path << "\n";

        } else if (cmd == "quit") {
            break;

        } else if (cmd == "help") {
            printHelp();

        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
            printHelp();
        }
        } catch (const std::out_of_range& e) {
            std::cerr << "Error: " << e.what() << "\n";
        } catch (const ContractViolation& e) {
            std::cerr << "Rejected: " << e.what() << "\n";
        }
    }

    return 0;
}
