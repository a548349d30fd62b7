#ifndef SPATIAL_GRID_H
#define SPATIAL_GRID_H

#include <cstdint>
#include <random>
#include <unordered_map>
#include <vector>

struct GridPos {
    int x = 0;
    int y = 0;

    bool operator==(const GridPos& other) const { return x == other.x && y == other.y; }
    bool operator!=(const GridPos& other) const { return !(*this == other); }
};

double euclidean(const GridPos& a, const GridPos& b);

enum class AgentKind : std::uint8_t {
    Household = 0,
    Enforcement = 1
};

// Non-owning reference to a stepping agent: (kind, owning region, id).
// Household ids are global; enforcement ids are unique within their region.
struct AgentHandle {
    AgentKind kind = AgentKind::Household;
    std::uint32_t region = 0;
    std::uint32_t id = 0;

    bool operator==(const AgentHandle& other) const {
        return kind == other.kind && region == other.region && id == other.id;
    }
};

// ---------- Spatial capability interface ----------
// The engine only needs these queries; placement realism is not its concern.
class SpatialIndex {
public:
    virtual ~SpatialIndex() = default;

    // Agents in the Moore square of `radius` around `center`, scanned row-major.
    virtual std::vector<AgentHandle> neighbors(GridPos center, int radius, bool includeCenter) const = 0;

    // In-bounds single-step Moore moves (current cell excluded), in a fixed order.
    virtual std::vector<GridPos> legalMoves(GridPos pos) const = 0;

    virtual bool inBounds(GridPos pos) const = 0;
    virtual bool contains(const AgentHandle& agent) const = 0;

    virtual void place(const AgentHandle& agent, GridPos pos) = 0;
    virtual void move(const AgentHandle& agent, GridPos pos) = 0;
    virtual void remove(const AgentHandle& agent) = 0;
};

// Bounded (non-toroidal) grid; any number of agents may share a cell.
class MultiGrid : public SpatialIndex {
public:
    MultiGrid(int width, int height);

    std::vector<AgentHandle> neighbors(GridPos center, int radius, bool includeCenter) const override;
    std::vector<GridPos> legalMoves(GridPos pos) const override;
    bool inBounds(GridPos pos) const override;
    bool contains(const AgentHandle& agent) const override;

    void place(const AgentHandle& agent, GridPos pos) override;
    void move(const AgentHandle& agent, GridPos pos) override;
    void remove(const AgentHandle& agent) override;

    // Position of a placed agent; throws std::out_of_range if absent.
    GridPos positionOf(const AgentHandle& agent) const;

    // Normal scatter around a centre, rounded and clamped into the grid.
    GridPos scatterAround(GridPos center, double spread, std::mt19937_64& rng) const;

    int width() const { return width_; }
    int height() const { return height_; }
    std::size_t agentCount() const { return positions_.size(); }

private:
    int width_;
    int height_;
    std::vector<std::vector<AgentHandle>> cells_;
    std::unordered_map<std::uint64_t, GridPos> positions_;

    std::size_t cellIndex(GridPos pos) const {
        return static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(pos.x);
    }
    static std::uint64_t key(const AgentHandle& agent);
    void detach(const AgentHandle& agent, GridPos pos);
};

#endif
