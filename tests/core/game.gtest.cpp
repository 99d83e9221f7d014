#include "core/game.hpp"
#include "core/gameError.hpp"

#include <array>
#include <gtest/gtest.h>
#include <numeric>
#include <queue>
#include <random>
#include <stdexcept>

namespace hex::gtest {

// Reference connectivity on the raw board, independent of RegionTracker.
static constexpr std::array<int, 6> kDx{0, 1, -1, 1, -1, 0};
static constexpr std::array<int, 6> kDy{-1, -1, 0, 0, 1, 1};

//! Component id per cell for stones of the given player, -1 elsewhere.
static std::vector<int> referenceComponents(const Board& board, Player player) {
	const auto size  = static_cast<int>(board.size());
	const auto stone = toStone(player);

	std::vector<int> component(board.size() * board.size(), -1);
	int next = 0;
	for (int start = 0; start != size * size; ++start) {
		const Coord startCoord{static_cast<Id>(start % size), static_cast<Id>(start / size)};
		if (component[start] != -1 || board.get(startCoord) != stone)
			continue;

		std::queue<int> open;
		open.push(start);
		component[start] = next;
		while (!open.empty()) {
			const int cell = open.front();
			open.pop();
			for (std::size_t i = 0; i < kDx.size(); ++i) {
				const int nx = cell % size + kDx[i];
				const int ny = cell / size + kDy[i];
				if (nx < 0 || ny < 0 || nx >= size || ny >= size)
					continue;

				const int neighbor = ny * size + nx;
				if (component[neighbor] == -1 && board.get({static_cast<Id>(nx), static_cast<Id>(ny)}) == stone) {
					component[neighbor] = next;
					open.push(neighbor);
				}
			}
		}
		++next;
	}
	return component;
}

//! True if a chain of the player's stones joins the player's two edges.
static bool referenceConnected(const Board& board, Player player) {
	const auto size      = board.size();
	const auto component = referenceComponents(board, player);

	std::vector<bool> touchesNear(size * size, false);
	for (std::size_t i = 0; i != size; ++i) {
		const auto near = player == Player::Black ? i : i * size;
		if (component[near] != -1) {
			touchesNear[static_cast<std::size_t>(component[near])] = true;
		}
	}
	for (std::size_t i = 0; i != size; ++i) {
		const auto far = player == Player::Black ? (size - 1u) * size + i : i * size + size - 1u;
		if (component[far] != -1 && touchesNear[static_cast<std::size_t>(component[far])]) {
			return true;
		}
	}
	return false;
}

//! Checks region labels, win flag and empty count against the reference.
static void expectConsistent(const Game& game) {
	const auto& board = game.board();
	const auto cells  = board.size() * board.size();

	EXPECT_EQ(game.emptyCount(), board.count(Board::Stone::Empty));

	for (const auto player: {Player::Black, Player::White}) {
		const auto& regions  = game.regions(player);
		const auto component = referenceComponents(board, player);

		for (Action a = 0; a != cells; ++a) {
			const auto ca = toCoord(a, board.size());
			if (component[a] == -1) {
				EXPECT_EQ(regions.label(ca), RegionTracker::NoRegion);
				continue;
			}
			EXPECT_NE(regions.label(ca), RegionTracker::NoRegion);

			for (Action b = a + 1u; b != cells; ++b) {
				if (component[b] == -1)
					continue;
				const auto sameLabel = regions.label(ca) == regions.label(toCoord(b, board.size()));
				EXPECT_EQ(sameLabel, component[a] == component[b]) << "cells " << a << " and " << b;
			}
		}

		EXPECT_EQ(regions.isConnected(), referenceConnected(board, player));
	}
}

//! Plays uniformly random legal moves until the game ends.
static std::vector<Action> randomPlayout(Game& game, unsigned seed, bool checkEveryMove) {
	std::mt19937 rng(seed);
	std::vector<Action> history;

	while (!game.isDone()) {
		const auto actions = game.possibleActions();
		std::uniform_int_distribution<std::size_t> pick(0u, actions.size() - 1u);
		const auto action = actions[pick(rng)];
		const auto mover  = game.currentPlayer();

		const auto wasConnected = referenceConnected(game.board(), mover);
		const auto winner       = game.applyMove(action);
		history.push_back(action);

		// Win is reported on exactly the move that completes the chain.
		EXPECT_FALSE(wasConnected);
		EXPECT_EQ(winner.has_value(), referenceConnected(game.board(), mover));
		if (winner) {
			EXPECT_EQ(*winner, mover);
		}
		if (checkEveryMove) {
			expectConsistent(game);
		}
	}
	return history;
}

TEST(Game, NewGame) {
	Game game;
	EXPECT_EQ(game.boardSize(), 5u);
	EXPECT_EQ(game.emptyCount(), 25u);
	EXPECT_EQ(game.currentPlayer(), Player::Black);
	EXPECT_EQ(game.status(), GameStatus::Active);
	EXPECT_EQ(game.moveMode(), MoveMode::Safe);
	EXPECT_FALSE(game.isDone());
	EXPECT_FALSE(game.winner().has_value());

	std::vector<Action> all(25u);
	std::iota(all.begin(), all.end(), Action{0});
	EXPECT_EQ(game.possibleActions(), all);
}

TEST(Game, TurnAlternation) {
	Game game(GameConfig{.boardSize = 4u, .startPlayer = Player::White});
	EXPECT_EQ(game.currentPlayer(), Player::White);

	game.applyMove(5u);
	EXPECT_EQ(game.board().get({1u, 1u}), Board::Stone::White);
	EXPECT_EQ(game.currentPlayer(), Player::Black);

	game.applyMove(6u);
	EXPECT_EQ(game.board().get({2u, 1u}), Board::Stone::Black);
	EXPECT_EQ(game.currentPlayer(), Player::White);
	EXPECT_EQ(game.emptyCount(), 14u);
}

// Black wins on the move completing the anti-diagonal, not before.
TEST(Game, WinOnCompletingMove) {
	Game game(GameConfig{.boardSize = 3u});

	EXPECT_FALSE(game.applyMove(4u)); // Black center
	EXPECT_FALSE(game.applyMove(0u)); // White
	EXPECT_FALSE(game.applyMove(2u)); // Black top right, touches top
	EXPECT_EQ(game.status(), GameStatus::Active);
	EXPECT_FALSE(game.applyMove(5u)); // White
	EXPECT_EQ(game.status(), GameStatus::Active);

	const auto winner = game.applyMove(6u); // Black bottom left, touches bottom
	ASSERT_TRUE(winner.has_value());
	EXPECT_EQ(*winner, Player::Black);
	EXPECT_EQ(game.status(), GameStatus::BlackWin);
	EXPECT_TRUE(game.isDone());
	EXPECT_EQ(game.winner(), Player::Black);
	EXPECT_EQ(game.emptyCount(), 4u);

	// Active player still flips on the final move.
	EXPECT_EQ(game.currentPlayer(), Player::White);
}

TEST(Game, WhiteWin) {
	Game game(GameConfig{.boardSize = 3u, .startPlayer = Player::White});

	game.applyMove(6u); // White (0, 2)
	game.applyMove(0u);
	game.applyMove(4u); // White center
	game.applyMove(1u);
	EXPECT_EQ(game.status(), GameStatus::Active);

	EXPECT_EQ(game.applyMove(2u), Player::White); // White (2, 0)
	EXPECT_EQ(game.status(), GameStatus::WhiteWin);
}

TEST(Game, SingleCellBoard) {
	for (const auto player: {Player::Black, Player::White}) {
		Game game(GameConfig{.boardSize = 1u, .startPlayer = player});
		EXPECT_EQ(game.applyMove(0u), player);
		EXPECT_EQ(game.status(), winStatus(player));
		EXPECT_EQ(game.emptyCount(), 0u);
	}
}

TEST(Game, RejectOccupiedCell) {
	Game game(GameConfig{.boardSize = 3u});
	game.applyMove(4u);

	const auto board = game.board();
	try {
		game.applyMove(4u);
		FAIL() << "Expected InvalidMove";
	} catch (const InvalidMove& e) {
		EXPECT_EQ(e.coord(), (Coord{1u, 1u}));
	}

	EXPECT_EQ(game.emptyCount(), 8u);
	EXPECT_EQ(game.currentPlayer(), Player::White);
	EXPECT_EQ(game.board(), board);
	EXPECT_FALSE(game.isValidMove(4u));
}

TEST(Game, RejectOutOfRangeAction) {
	Game game(GameConfig{.boardSize = 3u});

	try {
		game.applyMove(9u);
		FAIL() << "Expected OutOfRangeAction";
	} catch (const OutOfRangeAction& e) {
		EXPECT_EQ(e.action(), 9u);
	}
	EXPECT_THROW(game.applyMove(1000u), GameError);

	EXPECT_EQ(game.emptyCount(), 9u);
	EXPECT_EQ(game.currentPlayer(), Player::Black);
	EXPECT_FALSE(game.isValidMove(9u));
}

// Fast mode skips the occupancy check but still validates the range.
TEST(Game, FastModeRejectsOutOfRangeAction) {
	Game game(GameConfig{.boardSize = 3u, .moveMode = MoveMode::Fast});
	game.applyMove(4u);

	try {
		game.applyMove(11u);
		FAIL() << "Expected OutOfRangeAction";
	} catch (const OutOfRangeAction& e) {
		EXPECT_EQ(e.action(), 11u);
	}

	EXPECT_EQ(game.emptyCount(), 8u);
	EXPECT_EQ(game.currentPlayer(), Player::White);
	EXPECT_EQ(game.regions(Player::White).nextLabel(), 3u);
}

// Region accessor works on a mutable game between moves.
TEST(Game, RegionsOfRunningGame) {
	Game game(GameConfig{.boardSize = 3u});
	game.applyMove(4u);
	EXPECT_EQ(game.regions(Player::Black).label({1u, 1u}), 3u);
	EXPECT_EQ(game.regions(Player::White).label({1u, 1u}), RegionTracker::NoRegion);

	game.applyMove(3u);
	EXPECT_EQ(game.regions(Player::White).label({0u, 1u}), RegionTracker::NearEdge);
}

TEST(Game, RejectMovesAfterGameOver) {
	Game game(GameConfig{.boardSize = 1u});
	game.applyMove(0u);
	ASSERT_TRUE(game.isDone());

	EXPECT_THROW(game.applyMove(0u), GameOver);
	EXPECT_EQ(game.status(), GameStatus::BlackWin);
}

TEST(Game, PossibleActions) {
	Game game(GameConfig{.boardSize = 3u});
	game.applyMove(0u);
	game.applyMove(8u);
	game.applyMove(4u);

	EXPECT_EQ(game.possibleActions(), (std::vector<Action>{1u, 2u, 3u, 5u, 6u, 7u}));
}

TEST(Game, CopyIsIndependent) {
	Game original(GameConfig{.boardSize = 4u});
	original.applyMove(5u);

	auto copy = original.copy();
	EXPECT_EQ(copy.board(), original.board());
	EXPECT_EQ(copy.regions(Player::Black).labels(), original.regions(Player::Black).labels());

	copy.applyMove(6u);
	EXPECT_TRUE(original.board().isEmpty({2u, 1u}));
	EXPECT_EQ(original.emptyCount(), 15u);
	EXPECT_EQ(original.currentPlayer(), Player::White);
	EXPECT_EQ(original.regions(Player::White).label({2u, 1u}), RegionTracker::NoRegion);

	original.applyMove(0u);
	EXPECT_TRUE(copy.board().isEmpty({0u, 0u}));
	EXPECT_EQ(copy.emptyCount(), 14u);
}

TEST(Game, CopyKeepsTerminalState) {
	Game game(GameConfig{.boardSize = 1u});
	game.applyMove(0u);

	const auto copy = game.copy();
	EXPECT_EQ(copy.status(), GameStatus::BlackWin);
	EXPECT_EQ(copy.winner(), Player::Black);
	EXPECT_EQ(copy.currentPlayer(), Player::White);
}

TEST(Game, SuppliedPosition) {
	using S = Board::Stone;
	// . B .
	// W B .
	// . . .
	Board board(3u, {S::Empty, S::Black, S::Empty, S::White, S::Black, S::Empty, S::Empty, S::Empty, S::Empty});

	Game game(Player::White, board);
	EXPECT_EQ(game.currentPlayer(), Player::White);
	EXPECT_EQ(game.emptyCount(), 6u);
	EXPECT_EQ(game.status(), GameStatus::Active);
	EXPECT_EQ(game.regions(Player::Black).label({1u, 0u}), RegionTracker::NearEdge);
	EXPECT_EQ(game.regions(Player::Black).label({1u, 1u}), RegionTracker::NearEdge);
	EXPECT_EQ(game.regions(Player::White).label({0u, 1u}), RegionTracker::NearEdge);
	expectConsistent(game);

	game.applyMove(8u);
	EXPECT_EQ(game.applyMove(7u), Player::Black);
}

TEST(Game, SuppliedPositionAlreadyWon) {
	using S = Board::Stone;
	Board board(2u, {S::Black, S::White, S::Black, S::Empty});

	Game game(Player::White, board);
	EXPECT_EQ(game.status(), GameStatus::BlackWin);
	EXPECT_THROW(game.applyMove(3u), GameOver);
}

TEST(Game, CachedRegions) {
	Game played(GameConfig{.boardSize = 5u});
	std::mt19937 rng(7u);
	for (int i = 0; i != 8; ++i) {
		const auto actions = played.possibleActions();
		played.applyMove(actions[rng() % actions.size()]);
	}
	ASSERT_FALSE(played.isDone());

	Game replayed(Player::Black, played.board());
	Game cached(Player::Black, played.board(), replayed.regions(Player::Black), replayed.regions(Player::White));

	EXPECT_EQ(cached.regions(Player::Black).labels(), replayed.regions(Player::Black).labels());
	EXPECT_EQ(cached.regions(Player::White).labels(), replayed.regions(Player::White).labels());
	EXPECT_EQ(cached.emptyCount(), played.emptyCount());
	expectConsistent(cached);

	EXPECT_THROW(Game(Player::Black, played.board(), RegionTracker(4u, Player::Black), RegionTracker(5u, Player::White)),
	             std::invalid_argument);
}

// Full board without any connection only arises from inconsistent cached regions.
TEST(Game, DrawIsRepresentable) {
	using S = Board::Stone;
	Board full(2u, {S::Black, S::White, S::White, S::Black});

	Game game(Player::Black, full, RegionTracker(2u, Player::Black), RegionTracker(2u, Player::White));
	EXPECT_EQ(game.status(), GameStatus::Draw);
	EXPECT_TRUE(game.isDone());
	EXPECT_FALSE(game.winner().has_value());
}

TEST(Game, FastModeMatchesSafeMode) {
	Game safe(GameConfig{.boardSize = 6u});
	const auto history = randomPlayout(safe, 11u, false);

	Game fast(GameConfig{.boardSize = 6u, .moveMode = MoveMode::Fast});
	for (const auto action: history) {
		fast.applyMove(action);
	}

	EXPECT_EQ(fast.board(), safe.board());
	EXPECT_EQ(fast.status(), safe.status());
	EXPECT_EQ(fast.regions(Player::Black).labels(), safe.regions(Player::Black).labels());
	EXPECT_EQ(fast.regions(Player::White).labels(), safe.regions(Player::White).labels());
}

TEST(Game, RandomPlayoutsMatchReference) {
	for (std::size_t size = 1u; size <= 7u; ++size) {
		for (unsigned seed = 0u; seed != 10u; ++seed) {
			Game game(GameConfig{.boardSize = size, .startPlayer = seed % 2u ? Player::White : Player::Black});
			randomPlayout(game, seed, true);

			// Hex has no draws.
			EXPECT_NE(game.status(), GameStatus::Draw);
		}
	}
}

TEST(Game, Deterministic) {
	Game first(GameConfig{.boardSize = 7u});
	const auto history = randomPlayout(first, 42u, false);

	Game second(GameConfig{.boardSize = 7u});
	for (const auto action: history) {
		second.applyMove(action);
	}

	EXPECT_EQ(second.board(), first.board());
	EXPECT_EQ(second.status(), first.status());
	EXPECT_EQ(second.currentPlayer(), first.currentPlayer());
	EXPECT_EQ(second.regions(Player::Black).labels(), first.regions(Player::Black).labels());
	EXPECT_EQ(second.regions(Player::White).labels(), first.regions(Player::White).labels());
}

} // namespace hex::gtest
