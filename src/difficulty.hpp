#ifndef CHESSMASTER_DIFFICULTY_HPP
#define CHESSMASTER_DIFFICULTY_HPP

#include <array>
#include <string>

#include <nlohmann/json.hpp>

namespace chessmaster {

enum class Difficulty {
    EASY,
    MEDIUM,
    HARD,
    MASTER
};

struct DifficultyProfile {
    int depth;                     // search depth in plies
    double randomMoveProbability;  // chance of playing a random legal move instead of searching
};

const std::array<Difficulty, 4>& allDifficulties();

const DifficultyProfile& profileFor(Difficulty level);
const char* difficultyName(Difficulty level);
const char* difficultyDescription(Difficulty level);

// Case-insensitive, throws std::invalid_argument for unknown names.
Difficulty parseDifficulty(const std::string& name);

// {"difficulties": [{"name", "depth", "randomMoveProbability", "description"}, ...]}
nlohmann::json difficultyCatalogue();

} // namespace chessmaster

#endif // CHESSMASTER_DIFFICULTY_HPP
