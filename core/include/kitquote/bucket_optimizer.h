#pragma once

/// \file bucket_optimizer.h
/// \brief Minimum-cost choice of discrete pack sizes covering a required volume.

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace KitQuote {

/// One purchasable pack size of a role.
struct PackVariant {
    double size  = 0.0; ///< Pack unit: liters or meters.
    double price = 0.0;
};

/// Number of packs of one size in an optimizer answer.
struct PackCount {
    double size  = 0.0;
    int quantity = 0;
};

/// Default density limit: at most this many packs of any size other than the largest.
inline constexpr int kDefaultMaxNonLargestPacks = 3;

/// Largest discretized volume (size * scale) the optimizer accepts, 10,000 L at scale 100.
inline constexpr int64_t kMaxScaledVolume = 1'000'000;

/// Upper bound for OptimizerPolicy::max_non_largest_packs.
inline constexpr int kMaxNonLargestPacksLimit = 255;

/// Most distinct pack variants accepted in one call.
inline constexpr std::size_t kMaxPackVariants = 16;

/// Tuning knobs of OptimizeBuckets().
struct OptimizerPolicy {
    /// Cap on uses of every non-largest variant in one combination.
    /// A negative value removes the cap. Values above kMaxNonLargestPacksLimit are rejected.
    int max_non_largest_packs = kDefaultMaxNonLargestPacks;
    /// Discretization factor applied to sizes and volume (100 = centiliters).
    int scale = 100;
};

/// Find a minimum-cost multiset of packs whose total size is >= \p volume_needed.
///
/// Bounded dynamic program over the discretized volume, up to the requirement plus one
/// largest pack. Variants are tried largest first; the largest is unconstrained and the others
/// obey \p policy. Among sufficient volumes the lowest cost wins and ties keep the smallest
/// volume. Returns (size, quantity) pairs, largest size first, zero quantities omitted.
/// Returns an empty vector when \p variants is empty or \p volume_needed <= 0.
/// Throws InputError when the discretized volume exceeds kMaxScaledVolume, when more than
/// kMaxPackVariants usable variants are given, or when \p policy is out of range.
/// Variants larger than kMaxScaledVolume are skipped.
std::vector<PackCount> OptimizeBuckets(double volume_needed, std::span<const PackVariant> variants,
                                       const OptimizerPolicy& policy = OptimizerPolicy{});

/// Sum of size * quantity.
double TotalSize(std::span<const PackCount> packs);

/// Sum of price * quantity, pricing each size with the cheapest matching variant.
double TotalCost(std::span<const PackCount> packs, std::span<const PackVariant> variants);

} // namespace KitQuote
