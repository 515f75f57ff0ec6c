#ifndef TRANSMISSION_MODULE_H
#define TRANSMISSION_MODULE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "kernel/Entity.h"
#include "modules/Features.h"

class Kernel;

// What came out of one conversation
struct ExchangeSummary {
    std::size_t topics = 0;
    std::size_t statements = 0;     // statement records
    std::size_t lies = 0;           // lie records
    std::size_t overheard = 0;      // eavesdropping records
};

// ---------- Transmission ----------
// Conversations between two people, optionally overheard by a third
class TransmissionModule {
public:
    void configure(std::uint64_t seed);

    // Both participants talk about the subjects that matter most to the pair
    ExchangeSummary exchangeInformation(Kernel& kernel, std::uint32_t a, std::uint32_t b);

    // Subjects of a conversation: the union of both parties' salient entities, by combined salience
    std::vector<EntityRef> selectTopics(const Kernel& kernel, std::uint32_t a, std::uint32_t b) const;
    int topicCount(const Kernel& kernel, std::uint32_t a, std::uint32_t b) const;

    // Talker conveys their current beliefs about `features` of `subject`. Features the talker
    // holds no value for are skipped. Returns the number of features conveyed.
    std::size_t makeStatement(Kernel& kernel, std::uint32_t talker, std::uint32_t listener, EntityRef subject,
                              const std::vector<FeatureType>& features);

    // Liar tells recipient a value for `feature` of `subject` the liar does not believe
    void tellLie(Kernel& kernel, std::uint32_t liar, std::uint32_t recipient, EntityRef subject,
                 FeatureType feature, const std::string& falseValue);

private:
    void talkAbout(Kernel& kernel, std::uint32_t talker, std::uint32_t listener, EntityRef subject,
                   ExchangeSummary& summary);
    std::optional<std::uint32_t> pickEavesdropper(const Kernel& kernel, std::uint32_t talker,
                                                  std::uint32_t listener);
    double lieChance(const Kernel& kernel, std::uint32_t talker) const;

    std::mt19937_64 rng_{};
    std::size_t eavesdropped_ = 0;
};

#endif
