#include "config.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chessmaster {

EngineConfig EngineConfig::fromJson(const std::string& text, const std::string& source) {
    json document;
    try {
        document = json::parse(text);
    } catch (json::parse_error& e) {
        throw std::runtime_error(source + ": " + e.what());
    }

    if (!document.is_object()) {
        throw std::runtime_error(source + ": configuration must be a JSON object");
    }

    EngineConfig config;
    try {
        if (document.contains("difficulty")) {
            config.difficulty = parseDifficulty(document.at("difficulty").get<std::string>());
        }
        if (document.contains("seed") && !document.at("seed").is_null()) {
            config.seed = document.at("seed").get<uint32_t>();
        }
        config.verbose = document.value("verbose", config.verbose);
        config.search.useAlphaBeta = document.value("alphaBeta", config.search.useAlphaBeta);
        config.search.sideToMoveMaximizes =
            document.value("sideToMoveMaximizes", config.search.sideToMoveMaximizes);

        if (document.contains("transpositionTable")) {
            const json& table = document.at("transpositionTable");
            config.search.useTranspositionTable = table.value("enabled", config.search.useTranspositionTable);
            config.search.boundedTranspositions = table.value("bounded", config.search.boundedTranspositions);
            config.search.transpositionTableSize = table.value("size", config.search.transpositionTableSize);
        }

        if (document.contains("reference")) {
            const json& reference = document.at("reference");
            config.reference.url = reference.value("url", config.reference.url);
            config.reference.depth = reference.value("depth", config.reference.depth);
        }
    } catch (json::exception& e) {
        throw std::runtime_error(source + ": " + e.what());
    }

    if (config.search.transpositionTableSize < minTranspositionTableSize
        || config.search.transpositionTableSize > maxTranspositionTableSize) {
        throw std::runtime_error(source + ": transpositionTable.size must be between "
            + std::to_string(minTranspositionTableSize) + " and "
            + std::to_string(maxTranspositionTableSize));
    }

    config.search.logDiagnostics = config.verbose;
    return config;
}

EngineConfig EngineConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str(), path);
}

std::mt19937::result_type EngineConfig::resolvedSeed() const {
    if (seed) return *seed;
    return std::random_device{}();
}

} // namespace chessmaster
