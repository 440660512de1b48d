#ifndef CHESSMASTER_MOVEORDER_HPP
#define CHESSMASTER_MOVEORDER_HPP

#include "chess.hpp"

namespace chessmaster {

class MoveOrdering {
public:
    static constexpr int checkBonus = 50;

    // Sorts moves by descending heuristic score. The board is left unchanged.
    void orderMoves(chess::Movelist& moves, chess::Board& board) const;

    // MVV-LVA capture score, promotion value and check bonus.
    int scoreMove(chess::Board& board, chess::Move move) const;

private:
    int capturedPieceValue(const chess::Board& board, chess::Move move) const;
};

} // namespace chessmaster

#endif // CHESSMASTER_MOVEORDER_HPP
