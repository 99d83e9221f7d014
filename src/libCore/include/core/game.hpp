#pragma once

#include "core/gameConfig.hpp"
#include "core/gameStatus.hpp"
#include "core/regionTracker.hpp"
#include "data/board.hpp"

#include <optional>
#include <vector>

namespace hex {

//! Board state machine of a single hex game.
//! Every accepted move places a stone, merges the mover's regions and evaluates win/draw.
//! Single threaded. Use copy() to hand a game to another thread or a rollout.
class Game {
public:
	//! Empty board as configured.
	explicit Game(const GameConfig& config = {});

	//! Supplied position. Regions are computed by replaying every stone in row-major order.
	Game(Player activePlayer, Board board, MoveMode mode = MoveMode::Safe);

	//! Supplied position with cached regions. Skips the replay.
	Game(Player activePlayer, Board board, RegionTracker blackRegions, RegionTracker whiteRegions, MoveMode mode = MoveMode::Safe);

	//! Current player puts a stone on the given cell.
	//! Throws OutOfRangeAction in both modes. Safe mode also throws GameOver or InvalidMove.
	//! A rejected move leaves the game unchanged.
	//! \returns The winner if this move decided the game.
	std::optional<Player> applyMove(Action action);

	bool isValidMove(Action action) const;        //!< Action is on the board and the cell is empty.
	std::vector<Action> possibleActions() const; //!< All empty cells, ascending.

	//! Independent deep copy for speculative play.
	Game copy() const;

	const Board& board() const;
	const RegionTracker& regions(Player player) const;
	Player currentPlayer() const; //!< Flips on every move, including the final one.
	GameStatus status() const;
	bool isDone() const;
	std::optional<Player> winner() const;
	std::size_t emptyCount() const;
	std::size_t boardSize() const;
	MoveMode moveMode() const;

private:
	std::optional<Player> putStone(Action action); //!< Unchecked move.
	void evaluate(Player mover);                   //!< Update status after mover placed a stone.
	void evaluate();                               //!< Update status of a supplied position.

	RegionTracker& trackerOf(Player player);

private:
	Board m_board;
	RegionTracker m_blackRegions;
	RegionTracker m_whiteRegions;

	Player m_currentPlayer;
	MoveMode m_moveMode;
	std::size_t m_emptyCount;               //!< Tracked to avoid scanning the board per move.
	GameStatus m_status{GameStatus::Active};
};

} // namespace hex
