#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "chess.hpp"
#include "config.hpp"
#include "difficulty.hpp"
#include "engine.hpp"
#include "reference.hpp"
#include "rules.hpp"

using namespace chess;
using namespace chessmaster;

namespace {

void printIdentity() {
    std::cout << "id name ChessMaster" << std::endl;
    std::cout << "id author ChessMaster developers" << std::endl;
    std::cout << "option name Difficulty type combo default MEDIUM";
    for (Difficulty level : allDifficulties()) {
        std::cout << " var " << difficultyName(level);
    }
    std::cout << std::endl;
    std::cout << "option name Seed type spin default 0 min 0 max 4294967295" << std::endl;
    std::cout << "uciok" << std::endl;
}

bool isLegal(const Board& board, Move move) {
    Movelist moves;
    movegen::legalmoves(moves, board);
    for (const Move legal : moves) {
        if (legal == move) return true;
    }
    return false;
}

// Plays UCI moves from the stream; stops at the first illegal one.
void playMoves(Board& board, std::istream& in) {
    std::string token;
    while (in >> token) {
        Move move = uci::uciToMove(board, token);
        if (!isLegal(board, move)) {
            std::cerr << "info string illegal move " << token << " in " << board.getFen() << std::endl;
            return;
        }
        board.makeMove(move);
    }
}

void setPosition(Board& board, std::istringstream& iss) {
    std::string posType;
    iss >> posType;

    if (posType == "startpos") {
        board = Board();
        std::string movesMarker;
        if (iss >> movesMarker && movesMarker == "moves") {
            playMoves(board, iss);
        }
    } else if (posType == "fen") {
        std::string fen;
        std::string token;
        bool hasMoves = false;
        while (iss >> token) {
            if (token == "moves") {
                hasMoves = true;
                break;
            }
            if (!fen.empty()) fen += " ";
            fen += token;
        }

        board.setFen(fen);
        if (hasMoves) playMoves(board, iss);
    }
}

void setOption(Engine& engine, std::istringstream& iss) {
    std::string nameToken;
    iss >> nameToken;
    if (nameToken != "name") return;

    std::string optionName;
    iss >> optionName;
    std::string part;
    while (iss >> part && part != "value") {
        optionName += " " + part;
    }

    std::string optionValue;
    std::getline(iss, optionValue);
    if (!optionValue.empty() && optionValue[0] == ' ') {
        optionValue = optionValue.substr(1);
    }

    try {
        if (optionName == "Difficulty") {
            engine.setDifficulty(parseDifficulty(optionValue));
        } else if (optionName == "Seed") {
            engine.seed(static_cast<std::mt19937::result_type>(std::stoul(optionValue)));
        } else {
            std::cerr << "info string unknown option " << optionName << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "info string invalid value for " << optionName << ": " << e.what() << std::endl;
    }
}

void uciLoop(const EngineConfig& config) {
    Board board;
    Engine engine(config);
    ReferenceClient reference(config.reference);
    std::thread searchThread;

    auto waitForSearch = [&searchThread]() {
        if (searchThread.joinable()) searchThread.join();
    };

    std::string command;
    while (std::getline(std::cin, command)) {
        std::istringstream iss(command);
        std::string token;
        iss >> token;

        if (token == "isready") {
            std::cout << "readyok" << std::endl;
            continue;
        }

        // There is no way to interrupt a search, so every other command waits for it.
        waitForSearch();

        if (token == "uci") {
            printIdentity();
        } else if (token == "setoption") {
            setOption(engine, iss);
        } else if (token == "ucinewgame") {
            board = Board();
        } else if (token == "position") {
            setPosition(board, iss);
        } else if (token == "go") {
            searchThread = std::thread([&engine, &board]() {
                Move bestMove = engine.selectMove(board);
                std::cout << "bestmove " << (bestMove == Move::NO_MOVE ? "0000" : uci::moveToUci(bestMove))
                          << std::endl;
            });
        } else if (token == "stop") {
            // The search already ran to completion above.
        } else if (token == "eval") {
            std::cout << "Evaluation: " << engine.evaluatePawns(board)
                      << " (" << terminationName(termination(board)) << ")" << std::endl;
        } else if (token == "analyze") {
            nlohmann::json report = engine.analyze(board);
            std::cout << report.dump(2) << std::endl;
        } else if (token == "compare") {
            AnalysisReport report = engine.analyze(board);
            std::cout << "Engine evaluation: " << report.evaluation * 100
                      << " best move " << report.bestMove.value_or("none") << std::endl;
            if (auto remote = reference.fetch(board.getFen())) {
                if (remote->mate) {
                    std::cout << "Stockfish found checkmate in " << *remote->mate << " moves";
                } else {
                    std::cout << "Stockfish evaluation: " << remote->centipawns.value_or(0);
                }
                std::cout << " best move " << remote->bestMove << " in position " << board.getFen() << std::endl;
            }
        } else if (token == "difficulties") {
            std::cout << difficultyCatalogue().dump(2) << std::endl;
        } else if (token == "d") {
            std::cout << board.getFen() << std::endl;
        } else if (token == "quit") {
            break;
        }
    }

    waitForSearch();
}

} // namespace

int main(int argc, char* argv[]) {
    EngineConfig config;
    if (argc > 1) {
        try {
            config = EngineConfig::fromFile(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    try {
        uciLoop(config);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
