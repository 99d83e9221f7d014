#pragma once

#include "data/player.hpp"

#include <cstddef>

namespace hex {

//! How much Game::applyMove trusts its caller.
enum class MoveMode {
	Safe, //!< Reject finished games, out of range actions and occupied cells.
	Fast  //!< Only the range check. Playing an occupied cell or a finished game is undefined behaviour.
};

struct GameConfig {
	std::size_t boardSize{5u};
	Player startPlayer{Player::Black};
	MoveMode moveMode{MoveMode::Safe};
};

} // namespace hex
