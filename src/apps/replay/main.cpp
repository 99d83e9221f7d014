#include "Logging.hpp"

#include "core/game.hpp"
#include "core/gameError.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>

//! Parse a non-negative decimal number. Empty if the argument holds anything else.
static std::optional<std::size_t> parseNumber(std::string_view arg) {
	std::size_t value{};
	const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
	if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
		return std::nullopt;
	}
	return value;
}

//! Replays a list of actions on an empty board and prints the resulting game status.
//! Usage: hexReplay <boardSize> <action>...
int main(int argc, char** argv) {
	if (argc < 2) {
		std::cerr << "Usage: hexReplay <boardSize> <action>...\n";
		return 1;
	}

	const auto boardSize = parseNumber(argv[1]);
	if (!boardSize || *boardSize == 0u) {
		std::cerr << std::format("Invalid board size '{}'.\n", argv[1]);
		return 1;
	}

	auto logger = hex::replay::Logger();
	hex::Game game(hex::GameConfig{.boardSize = *boardSize});

	for (int i = 2; i < argc; ++i) {
		const auto action = parseNumber(argv[i]);
		if (!action) {
			std::cerr << std::format("Invalid action '{}'.\n", argv[i]);
			return 1;
		}

		const auto mover = game.currentPlayer();
		try {
			game.applyMove(*action);
		} catch (const hex::GameError& e) {
			logger.Log(Logging::LogLevel::Error, std::format("[Replay] Move {} rejected: {}", i - 1, e.what()));
			std::cerr << e.what() << '\n';
			return 1;
		}

		const auto c = hex::toCoord(*action, *boardSize);
		logger.Log(Logging::LogLevel::Info, std::format("[Replay] Move {}: {} plays ({}, {}).", i - 1, hex::toString(mover), c.y, c.x));
	}

	std::cout << hex::toString(game.status()) << '\n';
	return 0;
}
