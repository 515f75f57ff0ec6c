#pragma once

#include <cstdint>
#include <string>
#include "kernel/Entity.h"

enum class LifeStatus : std::uint8_t {
    Alive = 0,
    Dead = 1,
    Departed = 2
};

enum class MaritalStatus : std::uint8_t {
    Single = 0,
    Married = 1,
    Widowed = 2,
    Divorced = 3
};

// Big Five, each in [-1, 1]
struct Personality {
    double openness = 0.0;
    double conscientiousness = 0.0;
    double extroversion = 0.0;
    double agreeableness = 0.0;
    double neuroticism = 0.0;
};

// What a glance at someone reveals
struct Appearance {
    std::string skinColor = "beige";
    std::string hairLength = "medium";
    std::string hairColor = "brown";
    std::string eyeColor = "brown";
    std::string facialHairStyle = "none";
    std::string glasses = "no";
    std::string tattoo = "no";
    std::string scar = "no";
};

// ---------- Person Structure ----------
// Ground truth for one townsperson; the beliefs others hold about them live in their minds
struct Person {
    // Identity
    std::uint32_t id = 0;
    std::string firstName;
    std::string middleName;
    std::string lastName;
    std::string suffix;                 // empty when none
    bool female = false;

    // Demography
    int birthYear = 0;
    int age = 0;
    LifeStatus status = LifeStatus::Alive;
    MaritalStatus marital = MaritalStatus::Single;

    // Mental attributes
    Personality personality;
    double memory = 0.7;                // 0.1..0.9, scales encoding and decay

    Appearance appearance;

    // Home and work (place ids, -1 when none)
    std::int32_t home = -1;
    std::int32_t workplace = -1;
    std::string jobTitle;
    std::string jobShift;               // "day" or "night"
    bool retired = false;

    // Where this person is on the current timestep (place id, -1 when nowhere)
    std::int32_t location = -1;

    bool present() const { return status == LifeStatus::Alive; }
    std::string name() const { return firstName + " " + lastName; }
};
