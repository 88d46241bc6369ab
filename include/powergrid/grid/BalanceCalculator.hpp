#pragma once
#include <chrono>
#include <cstddef>
#include <vector>
#include <entt/entt.hpp>

#include "powergrid/grid/NetworkRegistry.hpp"

namespace powergrid {

struct BalancePass {
    std::vector<NetworkId> flipped;            // has_surplus changed, ascending
    NetworkId              slowest{NoNetwork};  // first network visited wins ties
    double                 slowest_ms{0.0};
    double                 elapsed_ms{0.0};
};

// Recomputes supply/demand for the networks it is handed, nothing else.
class BalanceCalculator {
public:
    explicit BalanceCalculator(double budget_ms = 50.0) : budget_ms_(budget_ms) {}

    void set_budget_ms(double ms) noexcept { budget_ms_ = ms; }
    [[nodiscard]] double budget_ms() const noexcept { return budget_ms_; }

    // `dirty` must be ascending and unique. Unknown ids are skipped.
    [[nodiscard]] BalancePass run(NetworkRegistry& networks, const entt::registry& reg,
                    const std::vector<NetworkId>& dirty) const;

    // Sums operational output and rated demand over the members. Pure apart
    // from writing the totals back into `net`.
    static void Recompute(Network& net, const entt::registry& reg);

private:
    double budget_ms_;
};

} // namespace powergrid
