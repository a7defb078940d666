#pragma once
#include "minerscan/net/NetConfig.hpp"

#include <cstddef>
#include <optional>
#include <set>

namespace minerscan::scan {

enum class SweepState {
    Idle,
    Running,
    Completed,
    Cancelled,
};

const char* toString(SweepState state);

/**
 * @brief Point-in-time view of a sweep.
 *
 * Within one sweep `completed` and `found` only grow, and
 * found <= completed <= total holds in every published snapshot.
 */
struct ScanProgress {
    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t found = 0;
    std::set<net::address_v4> inFlight;
    std::optional<net::address_v4> lastCompleted;
    SweepState state = SweepState::Idle;

    bool isFinished() const {
        return state == SweepState::Completed || state == SweepState::Cancelled;
    }
};

} // namespace minerscan::scan
