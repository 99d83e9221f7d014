#pragma once

#include "core/gameStatus.hpp"
#include "data/coordinate.hpp"
#include "data/player.hpp"

#include <optional>

namespace hex::env {

//! Outcome of a single applied move.
struct MoveDelta {
	unsigned moveId;              //!< Move number since the last reset, starting at 1.
	Player player;                //!< Player that made the move.
	Action action;                //!< Cell that was played.
	Player nextPlayer;            //!< Player to move next.
	GameStatus status;            //!< Game status after the move.
	std::optional<Player> winner; //!< Set once the game is decided.
};

} // namespace hex::env
