#include <gtest/gtest.h>

#include <string>

#include "chess.hpp"
#include "moveorder.hpp"

using namespace chess;
using namespace chessmaster;

TEST(MoveOrderingTest, MostValuableVictimLeastValuableAttacker) {
    Board board("4k3/8/8/3q4/4P3/8/8/Q3K3 w - - 0 1");
    MoveOrdering ordering;

    EXPECT_EQ(ordering.scoreMove(board, uci::uciToMove(board, "e4d5")), 9000 - 100);

    Board kingTakes("4k3/8/8/8/8/8/3p4/4K3 w - - 0 1");
    EXPECT_EQ(ordering.scoreMove(kingTakes, uci::uciToMove(kingTakes, "e1d2")), 1000 - 20000);
}

TEST(MoveOrderingTest, EnPassantCapturesAPawn) {
    Board board("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 1");
    MoveOrdering ordering;

    Move move = uci::uciToMove(board, "e5d6");
    ASSERT_EQ(move.typeOf(), Move::ENPASSANT);
    EXPECT_EQ(ordering.scoreMove(board, move), 1000 - 100);
}

TEST(MoveOrderingTest, CastlingIsNotACapture) {
    Board board("4k3/8/8/8/8/8/8/4K2R w K - 0 1");
    MoveOrdering ordering;

    Move move = uci::uciToMove(board, "e1g1");
    ASSERT_EQ(move.typeOf(), Move::CASTLING);
    EXPECT_EQ(ordering.scoreMove(board, move), 0);
}

TEST(MoveOrderingTest, PromotionAddsPromotedPieceValue) {
    Board board("8/P7/8/8/8/8/7k/4K3 w - - 0 1");
    MoveOrdering ordering;

    EXPECT_EQ(ordering.scoreMove(board, uci::uciToMove(board, "a7a8q")), 900);
    EXPECT_EQ(ordering.scoreMove(board, uci::uciToMove(board, "a7a8r")), 500);
    EXPECT_EQ(ordering.scoreMove(board, uci::uciToMove(board, "a7a8b")), 330);
    EXPECT_EQ(ordering.scoreMove(board, uci::uciToMove(board, "a7a8n")), 320);

    Movelist moves;
    movegen::legalmoves(moves, board);
    ordering.orderMoves(moves, board);
    EXPECT_EQ(uci::moveToUci(moves[0]), "a7a8q");
}

TEST(MoveOrderingTest, CheckingMoveGetsBonus) {
    Board board("4k3/8/8/8/8/8/8/R3K3 w - - 0 1");
    MoveOrdering ordering;

    EXPECT_EQ(ordering.scoreMove(board, uci::uciToMove(board, "a1a8")), MoveOrdering::checkBonus);
    EXPECT_EQ(ordering.scoreMove(board, uci::uciToMove(board, "a1a2")), 0);
}

TEST(MoveOrderingTest, MovesSortedByDescendingScore) {
    Board board("r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4");
    MoveOrdering ordering;

    Movelist moves;
    movegen::legalmoves(moves, board);
    const int count = static_cast<int>(moves.size());
    ordering.orderMoves(moves, board);

    ASSERT_EQ(static_cast<int>(moves.size()), count);
    for (int i = 1; i < count; i++) {
        EXPECT_GE(ordering.scoreMove(board, moves[i - 1]), ordering.scoreMove(board, moves[i]));
    }
    // Bxf7+ (1000 - 330 + 50) beats Qxf7+ (1000 - 900 + 50).
    EXPECT_EQ(uci::moveToUci(moves[0]), "c4f7");
}

TEST(MoveOrderingTest, OrderingLeavesBoardUntouched) {
    Board board("r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4");
    const std::string fen = board.getFen();
    const uint64_t hash = board.hash();
    MoveOrdering ordering;

    Movelist moves;
    movegen::legalmoves(moves, board);
    ordering.orderMoves(moves, board);

    EXPECT_EQ(board.getFen(), fen);
    EXPECT_EQ(board.hash(), hash);
}
