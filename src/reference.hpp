#ifndef CHESSMASTER_REFERENCE_HPP
#define CHESSMASTER_REFERENCE_HPP

#include <optional>
#include <string>
#include <utility>

#include "config.hpp"

namespace chessmaster {

// Evaluation of a position by a remote Stockfish service.
struct ReferenceEvaluation {
    std::optional<int> centipawns;  // positive favours White
    std::optional<int> mate;        // moves to mate, negative when Black mates
    std::string bestMove;           // UCI, empty when not reported
};

/**
 * Parses a response body of the form
 * {"success":true,"evaluation":0.33,"mate":null,"bestmove":"bestmove e2e4 ponder e7e5"}.
 * Returns an empty optional when the body is not JSON or reports no result.
 */
std::optional<ReferenceEvaluation> parseReferenceResponse(const std::string& body);

class ReferenceClient {
public:
    explicit ReferenceClient(ReferenceSettings settings) : settings_(std::move(settings)) {}

    std::optional<ReferenceEvaluation> fetch(const std::string& fen) const;

private:
    ReferenceSettings settings_;
};

} // namespace chessmaster

#endif // CHESSMASTER_REFERENCE_HPP
