#pragma once

#include "server/admission_scheduler.hpp"

#include <string>

namespace loadgate {

/**
 * @brief Render a scheduler snapshot as a single JSON object
 *
 * Layout:
 *   {"enabled":..,"dispatch_mode":"..","total_requests":..,...,
 *    "circuit_breaker":{"state":"..","is_open":..,"failure_count":..,...},
 *    "queue_sizes":{"critical":..,"high":..,"normal":..,"low":..},
 *    "cache":{"size":..,"keys":[..]},
 *    "query_stats":{"<operation>":{"count":..,...}},
 *    "timestamp":".."}
 */
[[nodiscard]] std::string stats_to_json(const SchedulerSnapshot& snapshot);

} // namespace loadgate
