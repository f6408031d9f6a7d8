#include "kitquote/bucket_optimizer.h"
#include "kitquote/common.h"
#include "kitquote/error.h"
#include "detail/round_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace KitQuote {
namespace {

struct ScaledVariant {
    double size   = 0.0;
    double price  = 0.0;
    int64_t units = 0; ///< size * scale
};

/// One discretized volume. The final answer is recovered by walking parent links, which stay
/// valid because a state is final before it is expanded.
struct DpState {
    double cost    = std::numeric_limits<double>::infinity();
    int64_t parent = -1;
    int32_t via    = -1; ///< Index of the variant that reached this state.
    bool reached   = false;
};

std::vector<ScaledVariant> PrepareVariants(std::span<const PackVariant> variants, int scale) {
    std::vector<ScaledVariant> out;
    out.reserve(variants.size());
    for (const PackVariant& v : variants) {
        const double scaled = v.size * static_cast<double>(scale);
        if (!(scaled >= 0.5) || scaled > static_cast<double>(kMaxScaledVolume) ||
            !std::isfinite(v.price) || v.price < 0.0) {
            spdlog::debug("OptimizeBuckets: skipping variant size={} price={}", v.size, v.price);
            continue;
        }
        out.push_back(ScaledVariant{v.size, v.price, std::llround(scaled)});
    }
    std::stable_sort(out.begin(), out.end(), [](const ScaledVariant& a, const ScaledVariant& b) {
        return a.units > b.units;
    });
    return out;
}

std::vector<int> CountPacks(const std::vector<DpState>& states, int64_t vol,
                            std::size_t variant_count) {
    std::vector<int> counts(variant_count, 0);
    for (int64_t s = vol; states[static_cast<std::size_t>(s)].parent >= 0;
         s = states[static_cast<std::size_t>(s)].parent) {
        ++counts[static_cast<std::size_t>(states[static_cast<std::size_t>(s)].via)];
    }
    return counts;
}

} // namespace

std::vector<PackCount> OptimizeBuckets(double volume_needed, std::span<const PackVariant> variants,
                                       const OptimizerPolicy& policy) {
    if (variants.empty() || !(volume_needed > 0.0)) { return {}; }
    if (!std::isfinite(volume_needed)) { throw InputError("Volume must be finite"); }
    if (policy.scale <= 0) { throw InputError("OptimizerPolicy scale must be positive"); }
    if (policy.max_non_largest_packs > kMaxNonLargestPacksLimit) {
        throw InputError("OptimizerPolicy max_non_largest_packs must be <= " +
                         std::to_string(kMaxNonLargestPacksLimit));
    }

    const double scale  = static_cast<double>(policy.scale);
    const double scaled = volume_needed * scale - detail::kRoundingEpsilon;
    if (!(scaled <= static_cast<double>(kMaxScaledVolume))) {
        throw InputError("Required volume " + FormatSize(volume_needed) +
                         " exceeds the optimizer limit of " +
                         FormatSize(static_cast<double>(kMaxScaledVolume) / scale));
    }

    const std::vector<ScaledVariant> sorted = PrepareVariants(variants, policy.scale);
    if (sorted.empty()) { return {}; }
    if (sorted.size() > kMaxPackVariants) {
        throw InputError("At most " + std::to_string(kMaxPackVariants) +
                         " pack variants are accepted, got " + std::to_string(sorted.size()));
    }

    const int64_t need = static_cast<int64_t>(std::ceil(scaled));
    const int64_t cap  = need + sorted.front().units;
    const auto states_n = static_cast<std::size_t>(cap) + 1;

    std::vector<DpState> states(states_n);
    states[0].cost    = 0.0;
    states[0].reached = true;

    // Uses of each non-largest variant on the path to a state, one row per state.
    const bool capped         = policy.max_non_largest_packs >= 0;
    const std::size_t tracked = capped ? sorted.size() - 1 : 0;
    std::vector<uint8_t> used(states_n * tracked, 0);

    for (int64_t vol = 0; vol <= cap; ++vol) {
        const DpState& state = states[static_cast<std::size_t>(vol)];
        if (!state.reached) { continue; }
        const std::size_t row = static_cast<std::size_t>(vol) * tracked;

        for (std::size_t i = 0; i < sorted.size(); ++i) {
            const int64_t next = vol + sorted[i].units;
            if (next > cap) { continue; }
            const bool is_largest = (i == 0);
            if (!is_largest && capped && used[row + i - 1] >= policy.max_non_largest_packs) {
                continue;
            }
            const double next_cost = state.cost + sorted[i].price;
            DpState& target        = states[static_cast<std::size_t>(next)];
            if (!target.reached || next_cost < target.cost) {
                target.cost    = next_cost;
                target.parent  = vol;
                target.via     = static_cast<int32_t>(i);
                target.reached = true;
                if (tracked > 0) {
                    const std::size_t next_row = static_cast<std::size_t>(next) * tracked;
                    std::copy_n(used.begin() + static_cast<std::ptrdiff_t>(row), tracked,
                                used.begin() + static_cast<std::ptrdiff_t>(next_row));
                    if (!is_largest) { ++used[next_row + i - 1]; }
                }
            }
        }
    }

    int64_t best = -1;
    for (int64_t vol = need; vol <= cap; ++vol) {
        const DpState& state = states[static_cast<std::size_t>(vol)];
        if (!state.reached) { continue; }
        if (best < 0 || state.cost < states[static_cast<std::size_t>(best)].cost) { best = vol; }
    }
    if (best < 0) {
        spdlog::debug("OptimizeBuckets: no feasible combination for {}", volume_needed);
        return {};
    }

    const std::vector<int> counts = CountPacks(states, best, sorted.size());
    std::vector<PackCount> result;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        if (counts[i] <= 0) { continue; }
        if (!result.empty() && result.back().size == sorted[i].size) {
            result.back().quantity += counts[i];
            continue;
        }
        result.push_back(PackCount{sorted[i].size, counts[i]});
    }

    spdlog::debug("OptimizeBuckets: need={} cap={} variants={} -> volume={} cost={:.2f}",
                  volume_needed, static_cast<double>(cap) / scale, sorted.size(),
                  static_cast<double>(best) / scale, states[static_cast<std::size_t>(best)].cost);
    return result;
}

double TotalSize(std::span<const PackCount> packs) {
    double total = 0.0;
    for (const PackCount& p : packs) { total += p.size * static_cast<double>(p.quantity); }
    return total;
}

double TotalCost(std::span<const PackCount> packs, std::span<const PackVariant> variants) {
    double total = 0.0;
    for (const PackCount& p : packs) {
        double unit = std::numeric_limits<double>::infinity();
        for (const PackVariant& v : variants) {
            if (v.size == p.size) { unit = std::min(unit, v.price); }
        }
        if (!std::isfinite(unit)) {
            throw InputError("No variant priced for pack size " + std::to_string(p.size));
        }
        total += unit * static_cast<double>(p.quantity);
    }
    return total;
}

} // namespace KitQuote
