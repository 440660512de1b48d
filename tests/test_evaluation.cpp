#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

#include "chess.hpp"
#include "evaluation.hpp"
#include "rules.hpp"

using namespace chess;
using namespace chessmaster;

namespace {

// Swaps colours and flips the board vertically.
std::string mirroredFen(const std::string& fen) {
    std::string placement = fen.substr(0, fen.find(' '));
    std::vector<std::string> ranks;
    std::stringstream ss(placement);
    std::string rank;
    while (std::getline(ss, rank, '/')) {
        for (char& c : rank) {
            if (std::isupper(static_cast<unsigned char>(c))) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            } else if (std::islower(static_cast<unsigned char>(c))) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
        }
        ranks.push_back(rank);
    }
    std::reverse(ranks.begin(), ranks.end());

    std::string result;
    for (size_t i = 0; i < ranks.size(); i++) {
        if (i > 0) result += "/";
        result += ranks[i];
    }
    return result + " w - - 0 1";
}

int legalMoveCount(const Board& board) {
    Movelist moves;
    movegen::legalmoves(moves, board);
    return static_cast<int>(moves.size());
}

} // namespace

TEST(EvaluationTest, CheckmatedBlackScoresWhiteWin) {
    Board board("4k3/4Q3/4K3/8/8/8/8/8 b - - 0 1");
    Evaluation evaluation;

    EXPECT_EQ(termination(board), Termination::CHECKMATE);
    EXPECT_EQ(evaluation.evaluate(board), 20000);
    EXPECT_DOUBLE_EQ(Evaluation::toPawns(evaluation.evaluate(board)), 200.0);
}

TEST(EvaluationTest, CheckmatedWhiteScoresBlackWin) {
    Board board("8/8/8/8/8/4k3/4q3/4K3 w - - 0 1");
    Evaluation evaluation;

    EXPECT_EQ(evaluation.evaluate(board), -20000);
}

TEST(EvaluationTest, StalemateIsDraw) {
    Board board("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    Evaluation evaluation;

    EXPECT_EQ(termination(board), Termination::STALEMATE);
    EXPECT_EQ(evaluation.evaluate(board), 0);
}

TEST(EvaluationTest, InsufficientMaterialIsDraw) {
    Evaluation evaluation;

    Board bareKings("8/8/8/4k3/8/8/8/4K3 w - - 0 1");
    EXPECT_EQ(termination(bareKings), Termination::INSUFFICIENT_MATERIAL);
    EXPECT_EQ(evaluation.evaluate(bareKings), 0);

    Board kingAndBishop("8/8/8/4k3/8/8/8/2B1K3 w - - 0 1");
    EXPECT_EQ(evaluation.evaluate(kingAndBishop), 0);
}

TEST(EvaluationTest, FiftyMoveRuleIsDraw) {
    Board board("4k3/8/8/8/8/8/4P3/4K3 w - - 100 80");
    Evaluation evaluation;

    EXPECT_EQ(termination(board), Termination::FIFTY_MOVES);
    EXPECT_EQ(evaluation.evaluate(board), 0);
}

TEST(EvaluationTest, ThreefoldRepetitionIsDraw) {
    Board board;
    for (int i = 0; i < 2; i++) {
        for (const char* uciMove : {"g1f3", "g8f6", "f3g1", "f6g8"}) {
            board.makeMove(uci::uciToMove(board, uciMove));
        }
    }
    Evaluation evaluation;

    EXPECT_EQ(termination(board), Termination::REPETITION);
    EXPECT_EQ(evaluation.evaluate(board), 0);
}

TEST(EvaluationTest, StartingPositionIsBalanced) {
    Board board;
    Evaluation evaluation;

    EXPECT_EQ(evaluation.materialAndPlacement(board), 0);
    EXPECT_EQ(evaluation.kingSafety(board), 0);
    EXPECT_EQ(evaluation.evaluate(board), 0);
}

TEST(EvaluationTest, KnightOnCentreSquare) {
    Board board("4k3/8/8/8/4N3/8/8/4K3 w - - 0 1");
    Evaluation evaluation;

    // Kings cancel out, the knight brings 320 plus 20 for e4.
    EXPECT_EQ(evaluation.materialAndPlacement(board), 340);
}

TEST(EvaluationTest, EndgameDetectionUsesLiteralThreshold) {
    EXPECT_FALSE(Evaluation::isEndgame(Board()));
    EXPECT_TRUE(Evaluation::isEndgame(Board("4k3/8/8/8/8/8/8/4K3 w - - 0 1")));
    // No queens, whatever else remains.
    EXPECT_TRUE(Evaluation::isEndgame(Board("rnb1kbnr/pppppppp/8/8/8/8/PPPPPPPP/RNB1KBNR w - - 0 1")));
    EXPECT_TRUE(Evaluation::isEndgame(Board("r2qk3/8/8/8/8/8/8/RN1QK3 w - - 0 1")));
    EXPECT_TRUE(Evaluation::isEndgame(Board("rn1qk3/8/8/8/8/8/8/RN1QK3 w - - 0 1")));
    EXPECT_FALSE(Evaluation::isEndgame(Board("rnbqk3/8/8/8/8/8/8/RN1QK3 w - - 0 1")));
    EXPECT_FALSE(Evaluation::isEndgame(Board("r2qk2r/8/8/8/8/8/8/RN1QK3 w - - 0 1")));
}

TEST(EvaluationTest, KingWithoutPawnCoverIsPenalised) {
    Evaluation evaluation;

    Board shielded("4k3/8/8/8/8/8/3PPP2/4K3 w - - 0 1");
    EXPECT_EQ(evaluation.kingSafety(shielded), 60);

    Board bare("4k3/8/8/8/8/8/8/4K3 w - - 0 1");
    EXPECT_EQ(evaluation.kingSafety(bare), 0);

    // A king on the edge only looks at two files.
    Board corner("k7/8/8/8/8/8/6PP/7K w - - 0 1");
    EXPECT_EQ(evaluation.kingSafety(corner), 40);
}

TEST(EvaluationTest, MobilityIsFromWhitePointOfView) {
    Evaluation evaluation;

    Board whiteToMove("4k3/8/8/8/8/8/8/R3K3 w - - 0 1");
    EXPECT_EQ(legalMoveCount(whiteToMove), 15);
    EXPECT_EQ(evaluation.mobility(whiteToMove, 15), 100);

    Board blackToMove("4k3/8/8/8/8/8/8/R3K3 b - - 0 1");
    EXPECT_EQ(legalMoveCount(blackToMove), 5);
    EXPECT_EQ(evaluation.mobility(blackToMove, 5), 100);
}

TEST(EvaluationTest, EvaluateLeavesBoardUntouched) {
    Board board("r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4");
    const std::string fen = board.getFen();
    const uint64_t hash = board.hash();
    Evaluation evaluation;

    evaluation.evaluate(board);

    EXPECT_EQ(board.getFen(), fen);
    EXPECT_EQ(board.hash(), hash);
    EXPECT_EQ(board.sideToMove(), Color::WHITE);
}

TEST(EvaluationTest, MaterialAndPlacementIsAntisymmetric) {
    Evaluation evaluation;
    const std::vector<std::string> positions = {
        "4k3/8/8/8/4N3/8/8/4K3 w - - 0 1",
        "r1bqkb1r/pppp1ppp/2n2n2/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R w - - 0 1",
        "6k1/5ppp/8/3q4/8/2N5/5PPP/R5K1 w - - 0 1",
        "8/8/3k4/8/1P6/8/5K2/8 w - - 0 1",
    };

    for (const std::string& fen : positions) {
        Board board(fen);
        Board mirrored(mirroredFen(fen));
        EXPECT_EQ(evaluation.materialAndPlacement(board), -evaluation.materialAndPlacement(mirrored)) << fen;
    }
}
