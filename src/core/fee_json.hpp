#pragma once

#include <nlohmann/json.hpp>
#include "fee_types.hpp"

namespace fee_estimator {

using json = nlohmann::json;

/**
 * Mirror node fee estimate JSON (snake_case). Parsing raises
 * InvalidFeeComponent for missing components, unknown modes and fields of the
 * wrong type.
 */
FeeEstimateResponse fee_response_from_json(const json& j);
json fee_response_to_json(const FeeEstimateResponse& response);

// Same layout as a response, but network.subtotal/total are ignored and any
// component may be absent.
FeeBreakdown fee_breakdown_from_json(const json& j);

FeeEstimate fee_estimate_from_json(const json& j);
json fee_estimate_to_json(const FeeEstimate& estimate);

} // namespace fee_estimator
