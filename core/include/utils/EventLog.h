#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <string>

enum class EventType : std::uint8_t {
    QuarterStart = 0,
    AllocationScaled = 1,
    UnitHired = 2,
    UnitRetired = 3,
    RewardDenied = 4,
    Warning = 5,
    COUNT
};

struct SimEvent {
    std::uint64_t tick = 0;
    EventType type = EventType::Warning;
    std::int32_t region = -1;   // -1 = ledger-wide
    double value = 0.0;
    std::string message;
};

/**
 * Event tracking for the simulation.
 *
 * Keeps the most recent `capacity` events in memory and a per-type counter
 * covering the whole run. When an echo stream is set every event is also
 * written there as one line (the CLI points it at std::cerr in verbose mode).
 */
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 4096);

    void record(std::uint64_t tick, EventType type, std::int32_t region,
                double value, std::string message = {});
    void clear();

    void setEcho(std::ostream* out) { echo_ = out; }
    void setCapacity(std::size_t capacity);

    const std::deque<SimEvent>& events() const { return events_; }
    std::uint64_t count(EventType type) const { return counts_[toIndex(type)]; }
    std::uint64_t totalRecorded() const { return total_; }

    static const char* typeName(EventType type);

private:
    std::deque<SimEvent> events_;
    std::array<std::uint64_t, static_cast<std::size_t>(EventType::COUNT)> counts_{};
    std::size_t capacity_;
    std::uint64_t total_ = 0;
    std::ostream* echo_ = nullptr;

    static std::size_t toIndex(EventType type) { return static_cast<std::size_t>(type); }
};

#endif
