#include "env/environment.hpp"

#include "Logging.hpp"
#include "core/gameError.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace hex::env {

Environment::Environment(OpponentPolicy policy, EnvConfig config)
    : m_policy{std::move(policy)}, m_config{std::move(config)},
      m_initialBoard{m_config.initialBoard ? *m_config.initialBoard : Board{m_config.boardSize}} {
	if (!m_policy) {
		throw std::invalid_argument("Environment needs an opponent policy.");
	}
}

ResetResult Environment::reset() {
	auto logger = Logger();

	if (m_initialRegions) {
		m_game.emplace(m_config.startPlayer, m_initialBoard, m_initialRegions->first, m_initialRegions->second, m_config.moveMode);
	} else {
		m_game.emplace(m_config.startPlayer, m_initialBoard, m_config.moveMode);
		m_initialRegions.emplace(m_game->regions(Player::Black), m_game->regions(Player::White));
		logger.Log(Logging::LogLevel::Debug, std::format("[Environment] Cached initial regions for board size {}.", m_initialBoard.size()));
	}

	m_previousOpponentMove.reset();
	m_moveId = 0;
	logger.Log(Logging::LogLevel::Info, std::format("[Environment] Reset. Playing {} against policy, {} to move.", toString(player()),
	                                                toString(m_game->currentPlayer())));

	if (!m_game->isDone() && m_game->currentPlayer() != player()) {
		opponentMove(MoveInfo{});
	}

	return ResetResult{
	        .observation = observe(),
	        .info        = MoveInfo{.lastMoveOpponent = m_previousOpponentMove, .lastMovePlayer = std::nullopt},
	};
}

StepResult Environment::step(const Action action) {
	if (!m_game) {
		throw std::logic_error("Environment::step called before reset.");
	}

	auto logger         = Logger();
	const auto snapshot = m_game->copy();
	const auto moveId   = m_moveId;

	if (m_game->isDone()) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Environment] Ignored action {}: game is over.", action));
	} else {
		try {
			play(action);
		} catch (const GameError& e) {
			logger.Log(Logging::LogLevel::Warning, std::format("[Environment] Rejected action {}: {}", action, e.what()));
			throw;
		}
	}

	std::optional<Action> opponentAction;
	if (!m_game->isDone()) {
		try {
			opponentAction = opponentMove(MoveInfo{.lastMoveOpponent = action, .lastMovePlayer = m_previousOpponentMove});
		} catch (const GameError&) {
			// Undo the agent move so the next step is played by the agent colour again.
			m_game.emplace(snapshot);
			m_moveId = moveId;
			throw;
		}
	}

	return StepResult{
	        .observation = observe(),
	        .reward      = reward(),
	        .done        = m_game->isDone(),
	        .info        = MoveInfo{.lastMoveOpponent = opponentAction, .lastMovePlayer = action},
	};
}

const Game& Environment::game() const {
	if (!m_game) {
		throw std::logic_error("Environment::game called before reset.");
	}
	return *m_game;
}

Player Environment::player() const {
	return m_config.playerColor;
}

Player Environment::opponentColor() const {
	return opponent(m_config.playerColor);
}

void Environment::subscribe(IMoveListener* listener) {
	m_eventHub.subscribe(listener);
}

void Environment::unsubscribe(IMoveListener* listener) {
	m_eventHub.unsubscribe(listener);
}

Action Environment::opponentMove(const MoveInfo& info) {
	const auto action = m_policy(m_game->board(), opponentColor(), info);

	try {
		play(action);
	} catch (const GameError& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Environment] Opponent policy chose illegal action {}: {}", action, e.what()));
		throw;
	}

	m_previousOpponentMove = action;
	return action;
}

void Environment::play(const Action action) {
	const auto mover = m_game->currentPlayer();
	m_game->applyMove(action);

	m_eventHub.signal(MoveDelta{
	        .moveId     = ++m_moveId,
	        .player     = mover,
	        .action     = action,
	        .nextPlayer = m_game->currentPlayer(),
	        .status     = m_game->status(),
	        .winner     = m_game->winner(),
	});

	if (m_game->isDone()) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Environment] Game over after {} moves: {}.", m_moveId, toString(m_game->status())));
	}
}

Observation Environment::observe() const {
	return Observation{.board = m_game->board(), .activePlayer = m_game->currentPlayer()};
}

int Environment::reward() const {
	const auto winner = m_game->winner();
	if (!winner) {
		return 0;
	}
	return *winner == player() ? 1 : -1;
}

} // namespace hex::env
