#ifndef CHESSMASTER_SEARCH_HPP
#define CHESSMASTER_SEARCH_HPP

#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <utility>

#include "chess.hpp"
#include "difficulty.hpp"
#include "evaluation.hpp"
#include "moveorder.hpp"
#include "transposition.hpp"

namespace chessmaster {

struct SearchSettings {
    bool useTranspositionTable = true;
    bool boundedTranspositions = true;
    bool useAlphaBeta = true;
    // When false, the reply to a root move maximizes exactly when Black is
    // to move, the convention of the Python engine this one replaces.
    bool sideToMoveMaximizes = true;
    bool logDiagnostics = false;
    uint64_t transpositionTableSize = 1 << 16;
};

class Search {
public:
    enum class State {
        IDLE,
        SEARCHING,
        DONE
    };

    struct SearchDiagnostics {
        int depth = 0;
        std::string move;
        int eval = 0;
        bool randomMove = false;
        int numNodes = 0;
        int numCutoffs = 0;
        int numTranspositions = 0;
        long long elapsedMs = 0;
    };

    static constexpr int positiveInfinity = 9999999;
    static constexpr int negativeInfinity = -positiveInfinity;

    explicit Search(SearchSettings settings = SearchSettings(),
                    std::mt19937::result_type seed = std::random_device{}());

    Search(const Search&) = delete;
    Search& operator=(const Search&) = delete;

    /**
     * Picks a move for the side to move. Returns Move::NO_MOVE when there is
     * no legal move. The board is restored before returning.
     */
    chess::Move selectMove(chess::Board& board, const DifficultyProfile& profile);

    // Best move and its value from the last selectMove() call.
    std::pair<chess::Move, int> getSearchResult() const;

    int nodesEvaluated() const { return numNodes; }
    State state() const { return state_; }
    const SearchDiagnostics& getDiagnostics() const { return searchDiagnostics; }

    const SearchSettings& settings() const { return settings_; }
    void setSettings(const SearchSettings& settings);

    void seed(std::mt19937::result_type seed) { rng.seed(seed); }

private:
    int minimax(chess::Board& board, int depth, int alpha, int beta, bool maximizing);
    void initDebugInfo();
    void logDebugInfo() const;

    SearchSettings settings_;
    State state_ = State::IDLE;
    std::mt19937 rng;

    Evaluation evaluation;
    MoveOrdering ordering;
    TranspositionTable transpositionTable;

    chess::Move bestMove = chess::Move::NO_MOVE;
    int bestEval = 0;

    SearchDiagnostics searchDiagnostics;
    int numNodes = 0;
    int numCutoffs = 0;
    int numTranspositions = 0;
    std::chrono::steady_clock::time_point searchStartTime;
};

} // namespace chessmaster

#endif // CHESSMASTER_SEARCH_HPP
