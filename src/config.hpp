#ifndef CHESSMASTER_CONFIG_HPP
#define CHESSMASTER_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "difficulty.hpp"
#include "search.hpp"

namespace chessmaster {

struct ReferenceSettings {
    std::string url = "https://stockfish.online/api/s/v2.php";
    int depth = 8;
};

struct EngineConfig {
    static constexpr uint64_t minTranspositionTableSize = 1;
    static constexpr uint64_t maxTranspositionTableSize = uint64_t(1) << 24;

    Difficulty difficulty = Difficulty::MEDIUM;
    std::optional<uint32_t> seed;
    bool verbose = false;
    SearchSettings search;
    ReferenceSettings reference;

    /**
     * Reads a configuration from JSON text. Missing fields keep their defaults.
     * @param text JSON document
     * @param source Name used in error messages
     * @throws std::runtime_error on malformed JSON, mistyped fields or a
     *         transposition table size outside [1, 2^24]
     * @throws std::invalid_argument on an unknown difficulty name
     */
    static EngineConfig fromJson(const std::string& text, const std::string& source = "<string>");

    static EngineConfig fromFile(const std::string& path);

    std::mt19937::result_type resolvedSeed() const;
};

} // namespace chessmaster

#endif // CHESSMASTER_CONFIG_HPP
