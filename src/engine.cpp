#include "engine.hpp"

#include <iostream>

using namespace chess;
using namespace std;

namespace chessmaster {

void to_json(nlohmann::json& j, const AnalysisReport& report) {
    j = nlohmann::json{
        {"fen", report.fen},
        {"evaluation", report.evaluation},
        {"depth", report.depth},
        {"nodesEvaluated", report.nodesEvaluated},
    };
    if (report.bestMove) {
        j["bestMove"] = *report.bestMove;
    } else {
        j["bestMove"] = nullptr;
    }
}

Engine::Engine(Difficulty difficulty)
    : profile_(profileFor(difficulty))
{
}

Engine::Engine(const EngineConfig& config)
    : profile_(profileFor(config.difficulty))
    , search_(config.search, config.resolvedSeed())
    , verbose_(config.verbose)
{
}

void Engine::setDifficulty(Difficulty difficulty) {
    profile_ = profileFor(difficulty);
}

void Engine::setDifficulty(const DifficultyProfile& profile) {
    profile_ = profile;
}

Move Engine::selectMove(Board& board) {
    if (verbose_) {
        cout << "Maximising score for " << board.sideToMove() << " at depth " << profile_.depth << endl;
    }

    Move bestMove = search_.selectMove(board, profile_);

    if (verbose_) {
        if (bestMove == Move::NO_MOVE) {
            cout << "No legal move in " << board.getFen() << endl;
        } else if (search_.getDiagnostics().randomMove) {
            cout << "Random move: " << uci::moveToSan(board, bestMove) << endl;
        } else {
            auto [move, eval] = search_.getSearchResult();
            cout << "Best move: " << uci::moveToSan(board, move) << " Eval: " << eval
                 << " Nodes: " << search_.nodesEvaluated() << endl;
        }
    }

    return bestMove;
}

int Engine::evaluate(Board& board) const {
    return evaluation_.evaluate(board);
}

double Engine::evaluatePawns(Board& board) const {
    return Evaluation::toPawns(evaluate(board));
}

AnalysisReport Engine::analyze(Board& board) {
    return analyze(board, profileFor(Difficulty::MASTER));
}

AnalysisReport Engine::analyze(Board& board, const DifficultyProfile& profile) {
    AnalysisReport report;
    report.fen = board.getFen();
    report.evaluation = evaluatePawns(board);
    report.depth = profile.depth;

    Move move = search_.selectMove(board, profile);
    if (move != Move::NO_MOVE) {
        report.bestMove = uci::moveToUci(move);
    }
    report.nodesEvaluated = search_.nodesEvaluated();
    return report;
}

} // namespace chessmaster
