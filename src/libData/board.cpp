#include "data/board.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace hex {

Board::Board(std::size_t size) : m_size(size), m_board(size * size, Stone::Empty) {
	if (size == 0u) {
		throw std::invalid_argument("Board size must be at least 1.");
	}
}

Board::Board(std::size_t size, std::vector<Stone> stones) : m_size(size), m_board(std::move(stones)) {
	if (size == 0u) {
		throw std::invalid_argument("Board size must be at least 1.");
	}
	if (m_board.size() != size * size) {
		throw std::invalid_argument(std::format("Board of size {} needs {} cells, got {}.", size, size * size, m_board.size()));
	}
}

std::size_t Board::size() const {
	return m_size;
}

bool Board::place(Coord c, Stone value) {
	assert(c.x < m_size && c.y < m_size); // Game should verify valid coordinate.
	assert(value != Stone::Empty);

	if (isEmpty(c)) {
		m_board[c.y * m_size + c.x] = value;
		return true;
	}
	return false;
}

Board::Stone Board::get(Coord c) const {
	assert(c.x < m_size && c.y < m_size); // Game should verify valid coordinate.
	return m_board[c.y * m_size + c.x];
}

bool Board::isEmpty(Coord c) const {
	return get(c) == Stone::Empty;
}

std::size_t Board::count(Stone value) const {
	return static_cast<std::size_t>(std::count(m_board.begin(), m_board.end(), value));
}

} // namespace hex
