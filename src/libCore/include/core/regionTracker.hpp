#pragma once

#include "data/coordinate.hpp"
#include "data/player.hpp"

#include <cstdint>
#include <vector>

namespace hex {

//! Tracks the connected stone groups of one player.
//! Labels live on the board padded by one virtual border cell on every side. The player's two
//! edges are seeded with the fixed labels NearEdge and FarEdge. Groups away from both edges get labels > FarEdge.
//! Merges always keep the smallest label, so once a group touches both edges it is labelled NearEdge
//! and the padded bottom right corner (initially FarEdge) flips to NearEdge.
class RegionTracker {
public:
	using Label = std::uint32_t;

	static constexpr Label NoRegion = 0u; //!< Cell not part of any region.
	static constexpr Label NearEdge = 1u; //!< Top edge for black, left edge for white.
	static constexpr Label FarEdge  = 2u; //!< Bottom edge for black, right edge for white.

public:
	//! Empty board with the borders of the given player seeded.
	RegionTracker(std::size_t boardSize, Player player);

	//! Adopt a previously computed padded label grid of (boardSize+2)^2 entries.
	//! Throws std::invalid_argument on size mismatch.
	RegionTracker(std::size_t boardSize, std::vector<Label> labels);

	//! Register a stone of this player that was just placed on the board.
	void insert(Coord c);

	//! True if one group joins both edges of this player.
	bool isConnected() const;

	Label label(Coord c) const;               //!< Label of a real board cell.
	const std::vector<Label>& labels() const; //!< Row-major padded label grid.
	Label nextLabel() const;                  //!< Label assigned to the next isolated stone.
	std::size_t boardSize() const;            //!< Side length of the real board.

private:
	std::size_t index(std::size_t row, std::size_t col) const;

private:
	std::size_t m_boardSize;      //!< Real board size N.
	std::size_t m_paddedSize;     //!< N + 2
	std::vector<Label> m_labels;  //!< Padded label grid.
	Label m_nextLabel{FarEdge + 1u};
};

} // namespace hex
