#pragma once

#include "core/game.hpp"
#include "env/eventHub.hpp"

#include <functional>
#include <optional>
#include <utility>

namespace hex::env {

//! Latest moves, seen from the side receiving the info.
struct MoveInfo {
	std::optional<Action> lastMoveOpponent; //!< Latest move of the other side.
	std::optional<Action> lastMovePlayer;   //!< Latest move of the receiving side.
};

//! Picks a legal action for the given player.
using OpponentPolicy = std::function<Action(const Board& board, Player player, const MoveInfo& info)>;

struct EnvConfig {
	Player playerColor{Player::Black};  //!< Colour controlled by the caller of step().
	Player startPlayer{Player::Black};  //!< Colour to move first after reset().
	std::size_t boardSize{5u};          //!< Used if no initial board is given.
	std::optional<Board> initialBoard{}; //!< Starting position. Empty board if not set.
	MoveMode moveMode{MoveMode::Safe};
};

struct Observation {
	Board board;         //!< Position after the last move.
	Player activePlayer; //!< Player to move.
};

struct ResetResult {
	Observation observation;
	MoveInfo info;
};

struct StepResult {
	Observation observation;
	int reward; //!< 1 if the controlled colour won, -1 if the opponent won, 0 otherwise.
	bool done;
	MoveInfo info;
};

//! Plays one side of a hex game against a fixed opponent policy.
//! The opponent answers inside reset() and step() whenever it is its turn.
class Environment {
public:
	Environment(OpponentPolicy policy, EnvConfig config = {});

	//! Restore the initial position. Lets the opponent open if it starts.
	ResetResult reset();

	//! Play the given action, then the opponent reply. Moves are skipped once the game is over.
	//! If the opponent policy picks an illegal cell, the GameError propagates and the agent move is
	//! undone as well. Listeners already received the delta of that agent move.
	//! \note Throws std::logic_error before the first reset().
	StepResult step(Action action);

	const Game& game() const;     //!< Running game. Only valid after reset().
	Player player() const;        //!< Colour controlled by the caller.
	Player opponentColor() const; //!< Colour controlled by the policy.

	void subscribe(IMoveListener* listener);
	void unsubscribe(IMoveListener* listener);

private:
	Action opponentMove(const MoveInfo& info); //!< Query the policy and apply its move. Info is seen from the policy side.
	void play(Action action);                  //!< Apply a move and signal the delta.
	Observation observe() const;
	int reward() const;

private:
	OpponentPolicy m_policy;
	EnvConfig m_config;
	Board m_initialBoard;

	//! Regions of the initial position. Computed on the first reset to skip the replay afterwards.
	std::optional<std::pair<RegionTracker, RegionTracker>> m_initialRegions;

	std::optional<Game> m_game;
	std::optional<Action> m_previousOpponentMove;
	unsigned m_moveId{0};

	EventHub m_eventHub;
};

} // namespace hex::env
