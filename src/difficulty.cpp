#include "difficulty.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace chessmaster {

namespace {

struct DifficultyEntry {
    const char* name;
    DifficultyProfile profile;
    const char* description;
};

const std::array<DifficultyEntry, 4> difficultyTable = {{
    {"EASY", {2, 0.30}, "Perfect for beginners, makes occasional mistakes"},
    {"MEDIUM", {4, 0.10}, "Balanced gameplay, suitable for casual players"},
    {"HARD", {6, 0.0}, "Strong tactical play, challenges experienced players"},
    {"MASTER", {8, 0.0}, "Near-optimal play with deep positional understanding"},
}};

const DifficultyEntry& entry(Difficulty level) {
    return difficultyTable[static_cast<size_t>(level)];
}

} // namespace

const std::array<Difficulty, 4>& allDifficulties() {
    static const std::array<Difficulty, 4> levels = {
        Difficulty::EASY, Difficulty::MEDIUM, Difficulty::HARD, Difficulty::MASTER
    };
    return levels;
}

const DifficultyProfile& profileFor(Difficulty level) {
    return entry(level).profile;
}

const char* difficultyName(Difficulty level) {
    return entry(level).name;
}

const char* difficultyDescription(Difficulty level) {
    return entry(level).description;
}

Difficulty parseDifficulty(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (Difficulty level : allDifficulties()) {
        if (upper == difficultyName(level)) return level;
    }
    throw std::invalid_argument("Unknown difficulty: " + name);
}

nlohmann::json difficultyCatalogue() {
    nlohmann::json levels = nlohmann::json::array();
    for (Difficulty level : allDifficulties()) {
        const DifficultyProfile& profile = profileFor(level);
        levels.push_back({
            {"name", difficultyName(level)},
            {"depth", profile.depth},
            {"randomMoveProbability", profile.randomMoveProbability},
            {"description", difficultyDescription(level)},
        });
    }
    nlohmann::json catalogue;
    catalogue["difficulties"] = levels;
    return catalogue;
}

} // namespace chessmaster
