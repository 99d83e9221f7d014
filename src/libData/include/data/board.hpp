#pragma once

#include "data/coordinate.hpp"
#include "data/player.hpp"

#include <cassert>
#include <vector>

namespace hex {

//! A rhombic hex board of arbitrary size, stored row-major.
class Board {
public:
	enum class Stone { Empty, Black, White };

	Board(std::size_t size);
	Board(std::size_t size, std::vector<Stone> stones); //!< Adopt a row-major position. Throws std::invalid_argument on size mismatch.

	bool place(Coord c, Stone value); //!< Try to place a stone at the given coordinate. False if not free.

	Stone get(Coord c) const;             //!< Get the stone at the given position.
	bool isEmpty(Coord c) const;          //!< True if the given coordinate is empty.
	std::size_t count(Stone value) const; //!< Number of cells holding the given value.
	std::size_t size() const;             //!< Size of the board.

	bool operator==(const Board&) const = default;

private:
	std::size_t m_size{0u};       //!< Side length of the board.
	std::vector<Stone> m_board{}; //!< Board data.
};

//! Maps a player color to a stone color.
inline constexpr Board::Stone toStone(const Player player) {
	assert(player == Player::Black || player == Player::White);
	return player == Player::White ? Board::Stone::White : Board::Stone::Black;
}

} // namespace hex
