#pragma once

#include "core/types.hpp"
#include "server/request_priority.hpp"

#include <array>
#include <cstddef>
#include <deque>
#include <optional>

namespace loadgate {

/**
 * @brief Four FIFO lanes, one per priority class
 *
 * pop_next() always takes the head of the first non-empty lane in
 * CRITICAL > HIGH > NORMAL > LOW order. No aging: a steady stream of
 * CRITICAL tickets starves the lower lanes.
 *
 * Not thread-safe. The owning scheduler serializes access.
 */
class PriorityLanes {
public:
    using LaneSizes = std::array<size_t, kPriorityLevelCount>;

    void push(AdmissionTicket ticket);

    [[nodiscard]] std::optional<AdmissionTicket> pop_next();

    [[nodiscard]] size_t size(PriorityLevel priority) const;
    [[nodiscard]] size_t total_size() const;
    [[nodiscard]] LaneSizes sizes() const;
    [[nodiscard]] bool empty() const { return total_size() == 0; }

private:
    std::array<std::deque<AdmissionTicket>, kPriorityLevelCount> lanes_;
};

} // namespace loadgate
