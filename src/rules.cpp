#include "rules.hpp"

using namespace chess;

namespace chessmaster {

Termination termination(const Board& board, const Movelist& legalMoves) {
    if (legalMoves.empty()) {
        return board.inCheck() ? Termination::CHECKMATE : Termination::STALEMATE;
    }
    if (board.isInsufficientMaterial()) return Termination::INSUFFICIENT_MATERIAL;
    if (board.isHalfMoveDraw()) return Termination::FIFTY_MOVES;
    if (board.isRepetition()) return Termination::REPETITION;
    return Termination::NONE;
}

Termination termination(const Board& board) {
    Movelist moves;
    movegen::legalmoves(moves, board);
    return termination(board, moves);
}

const char* terminationName(Termination t) {
    switch (t) {
        case Termination::CHECKMATE:
            return "checkmate";
        case Termination::STALEMATE:
            return "stalemate";
        case Termination::INSUFFICIENT_MATERIAL:
            return "insufficient material";
        case Termination::FIFTY_MOVES:
            return "fifty-move rule";
        case Termination::REPETITION:
            return "threefold repetition";
        case Termination::NONE:
            break;
    }
    return "none";
}

} // namespace chessmaster
