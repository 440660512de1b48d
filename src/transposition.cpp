#include "transposition.hpp"

namespace chessmaster {

TranspositionTable::TranspositionTable(uint64_t size, bool bounded) : size_(size), bounded_(bounded) {
    entries.reserve(size_);
}

void TranspositionTable::clear() {
    entries.clear();
}

std::optional<int> TranspositionTable::lookupEvaluation(uint64_t hash, int depth, int alpha, int beta) const {
    auto it = entries.find(hash);
    if (it == entries.end()) return std::nullopt;

    const Entry& entry = it->second;
    if (entry.depth < depth) return std::nullopt;
    if (!bounded_) return entry.value;

    if (entry.nodeType == exact) return entry.value;
    if (entry.nodeType == upperBound && entry.value <= alpha) return entry.value;
    if (entry.nodeType == lowerBound && entry.value >= beta) return entry.value;
    return std::nullopt;
}

void TranspositionTable::storeEvaluation(uint64_t hash, int depth, int eval, NodeType evalType) {
    if (entries.size() >= size_ && entries.find(hash) == entries.end()) {
        entries.clear();
    }
    entries[hash] = Entry(eval, depth, evalType);
}

} // namespace chessmaster
