#ifndef CHESSMASTER_TRANSPOSITION_HPP
#define CHESSMASTER_TRANSPOSITION_HPP

#include <cstdint>
#include <optional>
#include <unordered_map>

namespace chessmaster {

class TranspositionTable {
public:
    enum NodeType : uint8_t {
        exact = 0,
        lowerBound = 1,
        upperBound = 2
    };

    struct Entry {
        int value;
        int depth;
        NodeType nodeType;

        Entry() : value(0), depth(0), nodeType(exact) {}

        Entry(int value, int depth, NodeType nodeType)
            : value(value), depth(depth), nodeType(nodeType) {}
    };

    // A bounded table only answers when the stored bound is compatible with
    // the (alpha, beta) window. An unbounded table answers on depth alone.
    explicit TranspositionTable(uint64_t size, bool bounded = true);

    void clear();
    void setBounded(bool bounded) { bounded_ = bounded; }
    bool bounded() const { return bounded_; }

    std::optional<int> lookupEvaluation(uint64_t hash, int depth, int alpha, int beta) const;
    // Storing a new position into a full table empties it first.
    void storeEvaluation(uint64_t hash, int depth, int eval, NodeType evalType);

    std::size_t size() const { return entries.size(); }
    uint64_t capacity() const { return size_; }

private:
    std::unordered_map<uint64_t, Entry> entries;
    const uint64_t size_;
    bool bounded_;
};

} // namespace chessmaster

#endif // CHESSMASTER_TRANSPOSITION_HPP
