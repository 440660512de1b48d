#ifndef CHESSMASTER_TABLES_HPP
#define CHESSMASTER_TABLES_HPP

#include <array>

namespace chessmaster {

// Piece-square tables, indexed by square index (a1 = 0, h8 = 63).
// White reads a table directly, Black reads the vertically mirrored index.
namespace PieceSquareTable {

using Table = std::array<int, 64>;

extern const Table pawns;
extern const Table knights;
extern const Table bishops;
extern const Table rooks;
extern const Table queens;
extern const Table kingMiddle;
extern const Table kingEnd;

inline int read(const Table& table, int square, bool isWhite) {
    return table[isWhite ? square : square ^ 56];
}

} // namespace PieceSquareTable

} // namespace chessmaster

#endif // CHESSMASTER_TABLES_HPP
