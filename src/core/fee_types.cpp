#include "fee_types.hpp"
#include <algorithm>
#include <cctype>

namespace fee_estimator {

std::string mode_to_string(FeeEstimateMode mode) {
    switch (mode) {
        case FeeEstimateMode::STATE:
            return "STATE";
        case FeeEstimateMode::INTRINSIC:
            return "INTRINSIC";
    }
    return "STATE";
}

std::optional<FeeEstimateMode> mode_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "STATE") return FeeEstimateMode::STATE;
    if (upper == "INTRINSIC") return FeeEstimateMode::INTRINSIC;
    return std::nullopt;
}

} // namespace fee_estimator
