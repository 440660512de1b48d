#ifndef CHESSMASTER_ENGINE_HPP
#define CHESSMASTER_ENGINE_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chess.hpp"
#include "config.hpp"
#include "difficulty.hpp"
#include "evaluation.hpp"
#include "search.hpp"

namespace chessmaster {

struct AnalysisReport {
    std::string fen;
    double evaluation = 0.0;              // pawns, positive favours White
    std::optional<std::string> bestMove;  // UCI, empty when there is no legal move
    int depth = 0;
    int nodesEvaluated = 0;
};

void to_json(nlohmann::json& j, const AnalysisReport& report);

// One engine per game side. Calls must not overlap.
class Engine {
public:
    explicit Engine(Difficulty difficulty = Difficulty::MEDIUM);
    explicit Engine(const EngineConfig& config);

    void setDifficulty(Difficulty difficulty);
    void setDifficulty(const DifficultyProfile& profile);
    const DifficultyProfile& difficulty() const { return profile_; }

    chess::Move selectMove(chess::Board& board);
    int evaluate(chess::Board& board) const;
    double evaluatePawns(chess::Board& board) const;
    int nodesEvaluated() const { return search_.nodesEvaluated(); }

    AnalysisReport analyze(chess::Board& board);
    AnalysisReport analyze(chess::Board& board, const DifficultyProfile& profile);

    void seed(std::mt19937::result_type seed) { search_.seed(seed); }
    void setVerbose(bool verbose) { verbose_ = verbose; }

    const Search& search() const { return search_; }

private:
    DifficultyProfile profile_;
    Evaluation evaluation_;
    Search search_;
    bool verbose_ = false;
};

} // namespace chessmaster

#endif // CHESSMASTER_ENGINE_HPP
