#include "core/game.hpp"

#include "core/gameError.hpp"

#include <cassert>
#include <format>
#include <stdexcept>
#include <utility>

namespace hex {

Game::Game(const GameConfig& config)
    : m_board{config.boardSize}, m_blackRegions{config.boardSize, Player::Black}, m_whiteRegions{config.boardSize, Player::White},
      m_currentPlayer{config.startPlayer}, m_moveMode{config.moveMode}, m_emptyCount{config.boardSize * config.boardSize} {
}

Game::Game(const Player activePlayer, Board board, const MoveMode mode)
    : m_board{std::move(board)}, m_blackRegions{m_board.size(), Player::Black}, m_whiteRegions{m_board.size(), Player::White},
      m_currentPlayer{activePlayer}, m_moveMode{mode}, m_emptyCount{m_board.count(Board::Stone::Empty)} {
	const auto size = m_board.size();
	for (Id y = 0; y < size; ++y) {
		for (Id x = 0; x < size; ++x) {
			switch (m_board.get({x, y})) {
			case Board::Stone::Black:
				m_blackRegions.insert({x, y});
				break;
			case Board::Stone::White:
				m_whiteRegions.insert({x, y});
				break;
			case Board::Stone::Empty:
				break;
			}
		}
	}
	evaluate();
}

Game::Game(const Player activePlayer, Board board, RegionTracker blackRegions, RegionTracker whiteRegions, const MoveMode mode)
    : m_board{std::move(board)}, m_blackRegions{std::move(blackRegions)}, m_whiteRegions{std::move(whiteRegions)}, m_currentPlayer{activePlayer},
      m_moveMode{mode}, m_emptyCount{m_board.count(Board::Stone::Empty)} {
	if (m_blackRegions.boardSize() != m_board.size() || m_whiteRegions.boardSize() != m_board.size()) {
		throw std::invalid_argument(std::format("Region grids do not match board size {}.", m_board.size()));
	}
	evaluate();
}

std::optional<Player> Game::applyMove(const Action action) {
	if (m_moveMode == MoveMode::Safe && isDone()) {
		throw GameOver();
	}
	if (!isOnBoard(action, m_board.size())) {
		throw OutOfRangeAction(action, m_board.size());
	}
	if (m_moveMode == MoveMode::Safe && !m_board.isEmpty(toCoord(action, m_board.size()))) {
		throw InvalidMove(toCoord(action, m_board.size()));
	}

	return putStone(action);
}

bool Game::isValidMove(const Action action) const {
	return isOnBoard(action, m_board.size()) && m_board.isEmpty(toCoord(action, m_board.size()));
}

std::vector<Action> Game::possibleActions() const {
	std::vector<Action> actions;
	actions.reserve(m_emptyCount);

	const auto cells = m_board.size() * m_board.size();
	for (Action action = 0; action < cells; ++action) {
		if (m_board.isEmpty(toCoord(action, m_board.size()))) {
			actions.push_back(action);
		}
	}
	return actions;
}

Game Game::copy() const {
	return *this;
}

const Board& Game::board() const {
	return m_board;
}

const RegionTracker& Game::regions(const Player player) const {
	return player == Player::White ? m_whiteRegions : m_blackRegions;
}

RegionTracker& Game::trackerOf(const Player player) {
	return player == Player::White ? m_whiteRegions : m_blackRegions;
}

Player Game::currentPlayer() const {
	return m_currentPlayer;
}

GameStatus Game::status() const {
	return m_status;
}

bool Game::isDone() const {
	return m_status != GameStatus::Active;
}

std::optional<Player> Game::winner() const {
	return winnerOf(m_status);
}

std::size_t Game::emptyCount() const {
	return m_emptyCount;
}

std::size_t Game::boardSize() const {
	return m_board.size();
}

MoveMode Game::moveMode() const {
	return m_moveMode;
}

std::optional<Player> Game::putStone(const Action action) {
	const auto c     = toCoord(action, m_board.size());
	const auto mover = m_currentPlayer;

	[[maybe_unused]] const bool placed = m_board.place(c, toStone(mover));
	assert(placed); // Fast mode callers must only play empty cells.
	--m_emptyCount;

	trackerOf(mover).insert(c);
	evaluate(mover);

	m_currentPlayer = opponent(mover);
	return winner();
}

void Game::evaluate(const Player mover) {
	if (trackerOf(mover).isConnected()) {
		m_status = winStatus(mover);
	} else if (m_emptyCount == 0u) {
		m_status = GameStatus::Draw;
	}
}

void Game::evaluate() {
	if (m_blackRegions.isConnected()) {
		m_status = GameStatus::BlackWin;
	} else if (m_whiteRegions.isConnected()) {
		m_status = GameStatus::WhiteWin;
	} else if (m_emptyCount == 0u) {
		m_status = GameStatus::Draw;
	}
}

} // namespace hex
