#pragma once

#include "SimulationEvents.h"
#include <cstddef>
#include <vector>

// Bounded FIFO of pending simulation events, drained once per tick
class EventInbox {
public:
    explicit EventInbox(size_t capacity = 256);

    // Queue an event; refused with a warning when the inbox is full
    bool push(SimulationEvent event);

    // Take every queued event in arrival order
    std::vector<SimulationEvent> drain();

    size_t size() const { return pending_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return pending_.empty(); }
    size_t droppedCount() const { return dropped_; }

private:
    std::vector<SimulationEvent> pending_;
    size_t capacity_;
    size_t dropped_ = 0;
};
