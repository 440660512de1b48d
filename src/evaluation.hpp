#ifndef CHESSMASTER_EVALUATION_HPP
#define CHESSMASTER_EVALUATION_HPP

#include "chess.hpp"
#include "tables.hpp"

namespace chessmaster {

class Evaluation {
public:
    // Piece values
    static constexpr int pawnValue = 100;
    static constexpr int knightValue = 320;
    static constexpr int bishopValue = 330;
    static constexpr int rookValue = 500;
    static constexpr int queenValue = 900;
    static constexpr int kingValue = 20000;

    // Game state constants
    static constexpr int mateScore = kingValue;
    static constexpr int mobilityWeight = 10;
    static constexpr int openFilePenalty = 20;

    /**
     * Evaluates the position on the board
     * @param board The chess board to evaluate, restored before returning
     * @return Centipawn score, positive when White stands better
     */
    int evaluate(chess::Board& board) const;

    /**
     * Same as evaluate() for a position whose legal moves are already known
     * @param board The chess board to evaluate, restored before returning
     * @param legalMoves Legal moves of the side to move
     */
    int evaluate(chess::Board& board, const chess::Movelist& legalMoves) const;

    /**
     * Converts a centipawn score to pawns
     */
    static double toPawns(int score) { return score / 100.0; }

    /**
     * Value of a piece type, 0 for PieceType::NONE
     */
    static int pieceValue(chess::PieceType type);

    /**
     * Sums material and piece placement for both sides
     * @return White total minus Black total
     */
    int materialAndPlacement(const chess::Board& board) const;

    /**
     * Legal move count difference between White and Black, scaled by the mobility weight
     * @param board The chess board, the side to move is flipped and restored internally
     * @param sideToMoveCount Number of legal moves of the side to move
     */
    int mobility(chess::Board& board, int sideToMoveCount) const;

    /**
     * Penalises files next to each king that carry none of that side's pawns
     * @return Signed from White's point of view
     */
    int kingSafety(const chess::Board& board) const;

    /**
     * Endgame when no queens remain, or when queens, minor pieces and rooks
     * each number at most two across both sides
     */
    static bool isEndgame(const chess::Board& board);

private:
    int placement(chess::PieceType type, int square, bool isWhite, bool endgame) const;
};

} // namespace chessmaster

#endif // CHESSMASTER_EVALUATION_HPP
