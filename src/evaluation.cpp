#include "evaluation.hpp"
#include "rules.hpp"

#include <algorithm>
#include <array>

using namespace chess;

namespace chessmaster {

namespace {

const std::array<PieceType, 6> pieceTypes = {
    PieceType::PAWN, PieceType::KNIGHT, PieceType::BISHOP,
    PieceType::ROOK, PieceType::QUEEN, PieceType::KING
};

constexpr uint64_t fileA = 0x0101010101010101ULL;

int countBoth(const Board& board, PieceType type) {
    return board.pieces(type, Color::WHITE).count() + board.pieces(type, Color::BLACK).count();
}

} // namespace

int Evaluation::evaluate(Board& board) const {
    Movelist moves;
    movegen::legalmoves(moves, board);
    return evaluate(board, moves);
}

int Evaluation::evaluate(Board& board, const Movelist& legalMoves) const {
    switch (termination(board, legalMoves)) {
        case Termination::NONE:
            break;
        case Termination::CHECKMATE:
            // Mate is always bad for the side to move.
            return board.sideToMove() == Color::WHITE ? -mateScore : mateScore;
        default:
            return 0;
    }

    int eval = materialAndPlacement(board);
    eval += mobility(board, static_cast<int>(legalMoves.size()));
    eval += kingSafety(board);
    return eval;
}

int Evaluation::pieceValue(PieceType type) {
    static constexpr std::array<int, 7> values = {
        pawnValue, knightValue, bishopValue, rookValue, queenValue, kingValue, 0
    };
    return values[static_cast<int>(type)];
}

int Evaluation::materialAndPlacement(const Board& board) const {
    bool endgame = isEndgame(board);
    int whiteEval = 0;
    int blackEval = 0;

    for (PieceType type : pieceTypes) {
        Bitboard white = board.pieces(type, Color::WHITE);
        while (!white.empty()) {
            whiteEval += pieceValue(type) + placement(type, white.pop(), true, endgame);
        }
        Bitboard black = board.pieces(type, Color::BLACK);
        while (!black.empty()) {
            blackEval += pieceValue(type) + placement(type, black.pop(), false, endgame);
        }
    }

    return whiteEval - blackEval;
}

int Evaluation::mobility(Board& board, int sideToMoveCount) const {
    int opponentCount = 0;
    {
        ScopedNullMove flip(board);
        Movelist moves;
        movegen::legalmoves(moves, board);
        opponentCount = static_cast<int>(moves.size());
    }

    int score = (sideToMoveCount - opponentCount) * mobilityWeight;
    return board.sideToMove() == Color::WHITE ? score : -score;
}

int Evaluation::kingSafety(const Board& board) const {
    int score = 0;

    for (Color color : {Color(Color::WHITE), Color(Color::BLACK)}) {
        if (board.pieces(PieceType::KING, color).empty()) continue;

        int kingFile = board.kingSq(color).index() & 7;
        uint64_t pawns = board.pieces(PieceType::PAWN, color).getBits();
        int sign = color == Color::WHITE ? -1 : 1;

        for (int file = std::max(0, kingFile - 1); file <= std::min(7, kingFile + 1); file++) {
            if ((pawns & (fileA << file)) == 0) {
                score += sign * openFilePenalty;
            }
        }
    }

    return score;
}

bool Evaluation::isEndgame(const Board& board) {
    int queens = countBoth(board, PieceType::QUEEN);
    int minorPieces = countBoth(board, PieceType::KNIGHT) + countBoth(board, PieceType::BISHOP);
    int rooks = countBoth(board, PieceType::ROOK);

    return queens == 0 || (queens <= 2 && minorPieces <= 2 && rooks <= 2);
}

int Evaluation::placement(PieceType type, int square, bool isWhite, bool endgame) const {
    switch (static_cast<int>(type)) {
        case static_cast<int>(PieceType::PAWN):
            return PieceSquareTable::read(PieceSquareTable::pawns, square, isWhite);
        case static_cast<int>(PieceType::KNIGHT):
            return PieceSquareTable::read(PieceSquareTable::knights, square, isWhite);
        case static_cast<int>(PieceType::BISHOP):
            return PieceSquareTable::read(PieceSquareTable::bishops, square, isWhite);
        case static_cast<int>(PieceType::ROOK):
            return PieceSquareTable::read(PieceSquareTable::rooks, square, isWhite);
        case static_cast<int>(PieceType::QUEEN):
            return PieceSquareTable::read(PieceSquareTable::queens, square, isWhite);
        case static_cast<int>(PieceType::KING):
            return PieceSquareTable::read(endgame ? PieceSquareTable::kingEnd : PieceSquareTable::kingMiddle,
                                          square, isWhite);
    }
    return 0;
}

} // namespace chessmaster
