#pragma once

#include <cstddef>

namespace hex {

using Id     = unsigned;    //!< Board ID used by the core library.
using Action = std::size_t; //!< Flattened row-major cell index in [0, size*size).

//! Coordinate pair for the board.
//! \note Origin is the top left cell. x is the column, y is the row.
struct Coord {
	Id x, y;

	bool operator==(const Coord&) const = default;
};

//! Maps a flattened action to its cell. Row = action div size, column = action mod size.
inline constexpr Coord toCoord(const Action action, const std::size_t size) {
	return {static_cast<Id>(action % size), static_cast<Id>(action / size)};
}

//! Maps a cell to its flattened action.
inline constexpr Action toAction(const Coord c, const std::size_t size) {
	return static_cast<Action>(c.y) * size + c.x;
}

//! True if the action addresses a cell of a board with the given size.
inline constexpr bool isOnBoard(const Action action, const std::size_t size) {
	return action < size * size;
}

} // namespace hex
