#pragma once

#include "data/coordinate.hpp"

#include <format>
#include <stdexcept>

namespace hex {

//! Base of all recoverable rule violations. A rejected move leaves the game unchanged.
class GameError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Target cell is already occupied.
class InvalidMove : public GameError {
public:
	explicit InvalidMove(const Coord c) : GameError(std::format("Illegal move ({}, {}): cell is occupied.", c.y, c.x)), m_coord(c) {
	}

	Coord coord() const {
		return m_coord;
	}

private:
	Coord m_coord;
};

//! Action does not address a cell of the board.
class OutOfRangeAction : public GameError {
public:
	OutOfRangeAction(const Action action, const std::size_t boardSize)
	    : GameError(std::format("Action {} outside of [0, {}).", action, boardSize * boardSize)), m_action(action) {
	}

	Action action() const {
		return m_action;
	}

private:
	Action m_action;
};

//! Game already reached a terminal state.
class GameOver : public GameError {
public:
	GameOver() : GameError("Game is over. No further moves accepted.") {
	}
};

} // namespace hex
