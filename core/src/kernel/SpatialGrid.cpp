#include "kernel/SpatialGrid.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

double euclidean(const GridPos& a, const GridPos& b) {
    const double dx = static_cast<double>(a.x - b.x);
    const double dy = static_cast<double>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

MultiGrid::MultiGrid(int width, int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("MultiGrid dimensions must be > 0 (got " + std::to_string(width) +
                                    "x" + std::to_string(height) + ")");
    }
    cells_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), {});
}

std::uint64_t MultiGrid::key(const AgentHandle& agent) {
    // [kind(8)] [region(24)] [id(32)]
    return (static_cast<std::uint64_t>(agent.kind) << 56) |
           (static_cast<std::uint64_t>(agent.region & 0xFFFFFFu) << 32) |
           static_cast<std::uint64_t>(agent.id);
}

bool MultiGrid::inBounds(GridPos pos) const {
    return pos.x >= 0 && pos.y >= 0 && pos.x < width_ && pos.y < height_;
}

bool MultiGrid::contains(const AgentHandle& agent) const {
    return positions_.count(key(agent)) > 0;
}

std::vector<AgentHandle> MultiGrid::neighbors(GridPos center, int radius, bool includeCenter) const {
    std::vector<AgentHandle> found;
    if (radius < 0) {
        return found;
    }
    const int x0 = std::max(0, center.x - radius);
    const int x1 = std::min(width_ - 1, center.x + radius);
    const int y0 = std::max(0, center.y - radius);
    const int y1 = std::min(height_ - 1, center.y + radius);

    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            if (!includeCenter && x == center.x && y == center.y) continue;
            const auto& cell = cells_[cellIndex({x, y})];
            found.insert(found.end(), cell.begin(), cell.end());
        }
    }
    return found;
}

std::vector<GridPos> MultiGrid::legalMoves(GridPos pos) const {
    std::vector<GridPos> moves;
    moves.reserve(8);
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            if (dx == 0 && dy == 0) continue;
            GridPos next{pos.x + dx, pos.y + dy};
            if (inBounds(next)) {
                moves.push_back(next);
            }
        }
    }
    return moves;
}

void MultiGrid::place(const AgentHandle& agent, GridPos pos) {
    if (!inBounds(pos)) {
        throw std::invalid_argument("cannot place agent outside the grid at (" + std::to_string(pos.x) +
                                    "," + std::to_string(pos.y) + ")");
    }
    const auto k = key(agent);
    if (positions_.count(k)) {
        throw std::invalid_argument("agent " + std::to_string(agent.id) + " is already placed");
    }
    positions_[k] = pos;
    cells_[cellIndex(pos)].push_back(agent);
}

void MultiGrid::move(const AgentHandle& agent, GridPos pos) {
    if (!inBounds(pos)) {
        throw std::invalid_argument("cannot move agent outside the grid to (" + std::to_string(pos.x) +
                                    "," + std::to_string(pos.y) + ")");
    }
    auto it = positions_.find(key(agent));
    if (it == positions_.end()) {
        throw std::out_of_range("agent " + std::to_string(agent.id) + " is not on the grid");
    }
    if (it->second == pos) return;
    detach(agent, it->second);
    it->second = pos;
    cells_[cellIndex(pos)].push_back(agent);
}

void MultiGrid::remove(const AgentHandle& agent) {
    auto it = positions_.find(key(agent));
    if (it == positions_.end()) return;
    detach(agent, it->second);
    positions_.erase(it);
}

GridPos MultiGrid::positionOf(const AgentHandle& agent) const {
    auto it = positions_.find(key(agent));
    if (it == positions_.end()) {
        throw std::out_of_range("agent " + std::to_string(agent.id) + " is not on the grid");
    }
    return it->second;
}

GridPos MultiGrid::scatterAround(GridPos center, double spread, std::mt19937_64& rng) const {
    std::normal_distribution<double> dx(static_cast<double>(center.x), spread);
    std::normal_distribution<double> dy(static_cast<double>(center.y), spread);
    const long x = std::lround(dx(rng));
    const long y = std::lround(dy(rng));
    return {static_cast<int>(std::clamp<long>(x, 0, width_ - 1)),
            static_cast<int>(std::clamp<long>(y, 0, height_ - 1))};
}

void MultiGrid::detach(const AgentHandle& agent, GridPos pos) {
    auto& cell = cells_[cellIndex(pos)];
    cell.erase(std::remove(cell.begin(), cell.end(), agent), cell.end());
}
