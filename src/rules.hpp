#ifndef CHESSMASTER_RULES_HPP
#define CHESSMASTER_RULES_HPP

#include "chess.hpp"

namespace chessmaster {

enum class Termination {
    NONE,
    CHECKMATE,
    STALEMATE,
    INSUFFICIENT_MATERIAL,
    FIFTY_MOVES,
    REPETITION
};

/**
 * Classifies a position using the legal moves already generated for it.
 * Checkmate and stalemate take precedence over the claimable draws.
 */
Termination termination(const chess::Board& board, const chess::Movelist& legalMoves);

Termination termination(const chess::Board& board);

inline bool isDraw(Termination t) {
    return t != Termination::NONE && t != Termination::CHECKMATE;
}

const char* terminationName(Termination t);

// Plays one move for the lifetime of the guard.
class ScopedMove {
public:
    ScopedMove(chess::Board& board, chess::Move move) : board_(board), move_(move) {
        board_.makeMove(move_);
    }
    ~ScopedMove() { board_.unmakeMove(move_); }

    ScopedMove(const ScopedMove&) = delete;
    ScopedMove& operator=(const ScopedMove&) = delete;

private:
    chess::Board& board_;
    chess::Move move_;
};

// Hands the move to the other side without touching the pieces.
class ScopedNullMove {
public:
    explicit ScopedNullMove(chess::Board& board) : board_(board) {
        board_.makeNullMove();
    }
    ~ScopedNullMove() { board_.unmakeNullMove(); }

    ScopedNullMove(const ScopedNullMove&) = delete;
    ScopedNullMove& operator=(const ScopedNullMove&) = delete;

private:
    chess::Board& board_;
};

} // namespace chessmaster

#endif // CHESSMASTER_RULES_HPP
