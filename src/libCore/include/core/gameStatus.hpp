#pragma once

#include "data/player.hpp"

#include <optional>

namespace hex {

enum class GameStatus {
	Active,   //!< Game being played.
	BlackWin, //!< Black connected top and bottom.
	WhiteWin, //!< White connected left and right.
	Draw      //!< Board full without a connection. Unreachable under standard hex topology.
};

//! Status after the given player connected both of its edges.
inline constexpr GameStatus winStatus(const Player player) {
	return player == Player::White ? GameStatus::WhiteWin : GameStatus::BlackWin;
}

//! Winner encoded in the status, if any.
inline constexpr std::optional<Player> winnerOf(const GameStatus status) {
	switch (status) {
	case GameStatus::BlackWin:
		return Player::Black;
	case GameStatus::WhiteWin:
		return Player::White;
	default:
		return std::nullopt;
	}
}

inline constexpr const char* toString(const GameStatus status) {
	switch (status) {
	case GameStatus::Active:
		return "Active";
	case GameStatus::BlackWin:
		return "Black wins";
	case GameStatus::WhiteWin:
		return "White wins";
	case GameStatus::Draw:
		return "Draw";
	}
	return "Unknown";
}

} // namespace hex
