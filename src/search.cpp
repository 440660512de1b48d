#include "search.hpp"
#include "rules.hpp"

#include <algorithm>
#include <cstdio>

using namespace std;
using namespace chess;

namespace chessmaster {

namespace {

// Falls back to IDLE when a search is left by an exception.
class SearchStateGuard {
public:
    explicit SearchStateGuard(Search::State& state) : state_(state) {
        state_ = Search::State::SEARCHING;
    }
    ~SearchStateGuard() {
        if (state_ == Search::State::SEARCHING) state_ = Search::State::IDLE;
    }

    SearchStateGuard(const SearchStateGuard&) = delete;
    SearchStateGuard& operator=(const SearchStateGuard&) = delete;

    void done() { state_ = Search::State::DONE; }

private:
    Search::State& state_;
};

} // namespace

Search::Search(SearchSettings settings, std::mt19937::result_type seed)
    : settings_(settings)
    , rng(seed)
    , transpositionTable(settings.transpositionTableSize, settings.boundedTranspositions)
{
}

void Search::setSettings(const SearchSettings& settings) {
    settings_ = settings;
    transpositionTable.setBounded(settings_.boundedTranspositions);
}

Move Search::selectMove(Board& board, const DifficultyProfile& profile) {
    SearchStateGuard stateGuard(state_);
    initDebugInfo();
    transpositionTable.clear();

    bestMove = Move::NO_MOVE;
    bestEval = 0;
    searchDiagnostics.depth = profile.depth;

    Movelist moves;
    movegen::legalmoves(moves, board);

    if (moves.empty()) {
        stateGuard.done();
        return Move::NO_MOVE;
    }

    if (profile.randomMoveProbability > 0) {
        uniform_real_distribution<double> draw(0.0, 1.0);
        if (draw(rng) < profile.randomMoveProbability) {
            uniform_int_distribution<int> pick(0, static_cast<int>(moves.size()) - 1);
            bestMove = moves[pick(rng)];
            searchDiagnostics.randomMove = true;
            searchDiagnostics.move = uci::moveToUci(bestMove);
            stateGuard.done();
            return bestMove;
        }
    }

    ordering.orderMoves(moves, board);

    const bool whiteToMove = board.sideToMove() == Color::WHITE;
    const int childDepth = max(0, profile.depth - 1);
    int alpha = negativeInfinity;
    int beta = positiveInfinity;
    bestEval = whiteToMove ? negativeInfinity : positiveInfinity;

    // Every root move is searched; the window only narrows the subtrees.
    for (const Move move : moves) {
        int eval;
        {
            ScopedMove played(board, move);
            const bool whiteToReply = board.sideToMove() == Color::WHITE;
            eval = minimax(board, childDepth, alpha, beta,
                           settings_.sideToMoveMaximizes ? whiteToReply : !whiteToReply);
        }

        if (whiteToMove) {
            if (eval > bestEval) {
                bestEval = eval;
                bestMove = move;
            }
            if (settings_.useAlphaBeta) alpha = max(alpha, eval);
        } else {
            if (eval < bestEval) {
                bestEval = eval;
                bestMove = move;
            }
            if (settings_.useAlphaBeta) beta = min(beta, eval);
        }
    }

    searchDiagnostics.move = uci::moveToUci(bestMove);
    searchDiagnostics.eval = bestEval;
    searchDiagnostics.numNodes = numNodes;
    searchDiagnostics.numCutoffs = numCutoffs;
    searchDiagnostics.numTranspositions = numTranspositions;
    searchDiagnostics.elapsedMs = chrono::duration_cast<chrono::milliseconds>(
        chrono::steady_clock::now() - searchStartTime).count();

    if (settings_.logDiagnostics) logDebugInfo();

    stateGuard.done();
    return bestMove;
}

std::pair<Move, int> Search::getSearchResult() const {
    return {bestMove, bestEval};
}

int Search::minimax(Board& board, int depth, int alpha, int beta, bool maximizing) {
    numNodes++;

    const uint64_t hash = board.hash();
    if (settings_.useTranspositionTable) {
        if (auto cached = transpositionTable.lookupEvaluation(hash, depth, alpha, beta)) {
            numTranspositions++;
            return *cached;
        }
    }

    Movelist moves;
    movegen::legalmoves(moves, board);

    if (depth == 0 || termination(board, moves) != Termination::NONE) {
        int eval = evaluation.evaluate(board, moves);
        if (settings_.useTranspositionTable) {
            transpositionTable.storeEvaluation(hash, depth, eval, TranspositionTable::exact);
        }
        return eval;
    }

    ordering.orderMoves(moves, board);

    const int alphaOrig = alpha;
    const int betaOrig = beta;
    int value = maximizing ? negativeInfinity : positiveInfinity;

    for (const Move move : moves) {
        int eval;
        {
            ScopedMove played(board, move);
            eval = minimax(board, depth - 1, alpha, beta, !maximizing);
        }

        if (maximizing) {
            value = max(value, eval);
            if (settings_.useAlphaBeta) alpha = max(alpha, eval);
        } else {
            value = min(value, eval);
            if (settings_.useAlphaBeta) beta = min(beta, eval);
        }

        if (settings_.useAlphaBeta && beta <= alpha) {
            numCutoffs++;
            break;
        }
    }

    if (settings_.useTranspositionTable) {
        TranspositionTable::NodeType nodeType = TranspositionTable::exact;
        if (value <= alphaOrig) {
            nodeType = TranspositionTable::upperBound;
        } else if (value >= betaOrig) {
            nodeType = TranspositionTable::lowerBound;
        }
        transpositionTable.storeEvaluation(hash, depth, value, nodeType);
    }

    return value;
}

void Search::initDebugInfo() {
    searchStartTime = chrono::steady_clock::now();
    searchDiagnostics = SearchDiagnostics();
    numNodes = 0;
    numCutoffs = 0;
    numTranspositions = 0;
}

void Search::logDebugInfo() const {
    printf("Best move: %s Eval: %d Depth: %d Search time: %lld ms\n",
        searchDiagnostics.move.c_str(), searchDiagnostics.eval, searchDiagnostics.depth,
        searchDiagnostics.elapsedMs);
    printf("Num nodes: %d num cutoffs: %d num TThits %d\n",
        searchDiagnostics.numNodes, searchDiagnostics.numCutoffs, searchDiagnostics.numTranspositions);
}

} // namespace chessmaster
