#include "server/priority_lanes.hpp"

namespace loadgate {

void PriorityLanes::push(AdmissionTicket ticket) {
    lanes_[priority_index(ticket.priority)].push_back(std::move(ticket));
}

std::optional<AdmissionTicket> PriorityLanes::pop_next() {
    for (const auto priority : kDispatchOrder) {
        auto& lane = lanes_[priority_index(priority)];
        if (!lane.empty()) {
            AdmissionTicket ticket = std::move(lane.front());
            lane.pop_front();
            return ticket;
        }
    }
    return std::nullopt;
}

size_t PriorityLanes::size(PriorityLevel priority) const {
    return lanes_[priority_index(priority)].size();
}

size_t PriorityLanes::total_size() const {
    size_t total = 0;
    for (const auto& lane : lanes_) {
        total += lane.size();
    }
    return total;
}

PriorityLanes::LaneSizes PriorityLanes::sizes() const {
    LaneSizes result{};
    for (size_t i = 0; i < kPriorityLevelCount; ++i) {
        result[i] = lanes_[i].size();
    }
    return result;
}

} // namespace loadgate
