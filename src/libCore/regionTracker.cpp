#include "core/regionTracker.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <format>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace hex {

// Hex neighbourhood: the 3x3 window without its top left and bottom right corner.
static constexpr std::array<int, 6> kDx{0, 1, -1, 1, -1, 0};
static constexpr std::array<int, 6> kDy{-1, -1, 0, 0, 1, 1};

RegionTracker::RegionTracker(const std::size_t boardSize, const Player player)
    : m_boardSize(boardSize), m_paddedSize(boardSize + 2u), m_labels(m_paddedSize * m_paddedSize, NoRegion) {
	if (boardSize == 0u) {
		throw std::invalid_argument("Board size must be at least 1.");
	}

	const auto last = m_paddedSize - 1u;
	for (std::size_t i = 0; i != m_paddedSize; ++i) {
		if (player == Player::Black) {
			m_labels[index(0u, i)]   = NearEdge;
			m_labels[index(last, i)] = FarEdge;
		} else {
			m_labels[index(i, 0u)]   = NearEdge;
			m_labels[index(i, last)] = FarEdge;
		}
	}
}

RegionTracker::RegionTracker(const std::size_t boardSize, std::vector<Label> labels)
    : m_boardSize(boardSize), m_paddedSize(boardSize + 2u), m_labels(std::move(labels)) {
	if (boardSize == 0u) {
		throw std::invalid_argument("Board size must be at least 1.");
	}
	if (m_labels.size() != m_paddedSize * m_paddedSize) {
		throw std::invalid_argument(
		        std::format("Region grid for board size {} needs {} cells, got {}.", boardSize, m_paddedSize * m_paddedSize, m_labels.size()));
	}

	m_nextLabel = std::max(*std::max_element(m_labels.begin(), m_labels.end()), FarEdge) + 1u;
}

void RegionTracker::insert(const Coord c) {
	assert(c.x < m_boardSize && c.y < m_boardSize);

	const auto row = static_cast<std::size_t>(c.y) + 1u;
	const auto col = static_cast<std::size_t>(c.x) + 1u;

	std::array<Label, kDx.size()> adjacent{};
	for (std::size_t i = 0; i < kDx.size(); ++i) {
		const auto ny = static_cast<std::size_t>(static_cast<int>(row) + kDy[i]);
		const auto nx = static_cast<std::size_t>(static_cast<int>(col) + kDx[i]);
		adjacent[i]   = m_labels[index(ny, nx)];
	}

	std::sort(adjacent.begin(), adjacent.end());
	const auto last  = std::unique(adjacent.begin(), adjacent.end());
	const auto first = std::upper_bound(adjacent.begin(), last, NoRegion);

	// Isolated stone starts a new region.
	if (first == last) {
		m_labels[index(row, col)] = m_nextLabel++;
		return;
	}

	const auto region         = *first;
	m_labels[index(row, col)] = region;
	for (auto it = std::next(first); it != last; ++it) {
		std::replace(m_labels.begin(), m_labels.end(), *it, region);
	}
}

bool RegionTracker::isConnected() const {
	return m_labels.back() == NearEdge;
}

RegionTracker::Label RegionTracker::label(const Coord c) const {
	assert(c.x < m_boardSize && c.y < m_boardSize);
	return m_labels[index(static_cast<std::size_t>(c.y) + 1u, static_cast<std::size_t>(c.x) + 1u)];
}

const std::vector<RegionTracker::Label>& RegionTracker::labels() const {
	return m_labels;
}

RegionTracker::Label RegionTracker::nextLabel() const {
	return m_nextLabel;
}

std::size_t RegionTracker::boardSize() const {
	return m_boardSize;
}

std::size_t RegionTracker::index(const std::size_t row, const std::size_t col) const {
	return row * m_paddedSize + col;
}

} // namespace hex
