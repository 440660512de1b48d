#include "moveorder.hpp"
#include "evaluation.hpp"
#include "rules.hpp"

#include <algorithm>

using namespace chess;

namespace chessmaster {

void MoveOrdering::orderMoves(Movelist& moves, Board& board) const {
    for (auto& move : moves) {
        move.setScore(static_cast<int16_t>(scoreMove(board, move)));
    }

    std::sort(moves.begin(), moves.end(), [](const Move& a, const Move& b) {
        return a.score() > b.score();
    });
}

int MoveOrdering::scoreMove(Board& board, Move move) const {
    int score = 0;

    if (board.isCapture(move)) {
        int attacker = Evaluation::pieceValue(board.at(move.from()).type());
        score += capturedPieceValue(board, move) * 10 - attacker;
    }

    if (move.typeOf() == Move::PROMOTION) {
        score += Evaluation::pieceValue(move.promotionType());
    }

    ScopedMove played(board, move);
    if (board.inCheck()) {
        score += checkBonus;
    }

    return score;
}

int MoveOrdering::capturedPieceValue(const Board& board, Move move) const {
    if (move.typeOf() == Move::ENPASSANT) {
        return Evaluation::pawnValue;
    }
    return Evaluation::pieceValue(board.at(move.to()).type());
}

} // namespace chessmaster
