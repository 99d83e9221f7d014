#pragma once

namespace hex {

//! Black connects the top and bottom edges, White connects the left and right edges.
enum class Player { Black = 1, White = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::White ? Player::Black : Player::White;
}

//! Human readable colour name.
inline constexpr const char* toString(Player player) {
	return player == Player::White ? "White" : "Black";
}

} // namespace hex
