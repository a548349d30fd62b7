#include "utils/EventLog.h"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

EventLog::EventLog(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void EventLog::record(std::uint64_t tick, EventType type, std::int32_t region,
                      double value, std::string message) {
    counts_[toIndex(type)]++;
    total_++;

    if (echo_) {
        // Formatted locally so the echo stream keeps its own flags
        std::ostringstream line;
        line << "[" << typeName(type) << "] tick=" << tick;
        if (region >= 0) {
            line << " region=" << region;
        }
        line << " value=" << std::fixed << std::setprecision(2) << value;
        if (!message.empty()) {
            line << " " << message;
        }
        line << "\n";
        *echo_ << line.str();
    }

    SimEvent ev;
    ev.tick = tick;
    ev.type = type;
    ev.region = region;
    ev.value = value;
    ev.message = std::move(message);
    events_.push_back(std::move(ev));
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

void EventLog::clear() {
    events_.clear();
    counts_.fill(0);
    total_ = 0;
}

void EventLog::setCapacity(std::size_t capacity) {
    capacity_ = capacity == 0 ? 1 : capacity;
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

const char* EventLog::typeName(EventType type) {
    switch (type) {
        case EventType::QuarterStart: return "quarter";
        case EventType::AllocationScaled: return "scaled";
        case EventType::UnitHired: return "hire";
        case EventType::UnitRetired: return "retire";
        case EventType::RewardDenied: return "reward-denied";
        case EventType::Warning: return "warning";
        default: return "unknown";
    }
}
