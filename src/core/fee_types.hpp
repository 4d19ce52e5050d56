#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fee_estimator {

/**
 * Estimation mode. STATE may consult current ledger state (existing accounts,
 * tokens); INTRINSIC prices the transaction from its structure alone.
 */
enum class FeeEstimateMode { STATE, INTRINSIC };

std::string mode_to_string(FeeEstimateMode mode);
// Case-insensitive; std::nullopt for unknown names.
std::optional<FeeEstimateMode> mode_from_string(const std::string& name);

// All amounts are in tinybars.
struct FeeExtra {
    std::string name;
    int64_t included{0};
    int64_t count{0};
    int64_t charged{0};
    int64_t fee_per_unit{0};
    int64_t subtotal{0};
};

struct FeeEstimate {
    int64_t base{0};
    std::vector<FeeExtra> extras;
    int64_t subtotal{0};            // base + extras, filled by the aggregator
    bool subtotal_reported{false};  // subtotal came from the estimator, not computed
};

struct NetworkFeeEstimate {
    int64_t multiplier{0};
    int64_t subtotal{0};            // node subtotal * multiplier
};

struct FeeEstimateResponse {
    FeeEstimateMode mode{FeeEstimateMode::STATE};
    NetworkFeeEstimate network;
    FeeEstimate node;
    FeeEstimate service;
    std::vector<std::string> notes;
    int64_t total{0};
};

/**
 * Unaggregated fee figures. Absent optionals are missing components and are
 * rejected by derive_response().
 */
struct FeeBreakdown {
    std::optional<FeeEstimateMode> mode;
    std::optional<int64_t> network_multiplier;
    std::optional<FeeEstimate> node;
    std::optional<FeeEstimate> service;
    std::vector<std::string> notes;
};

} // namespace fee_estimator
