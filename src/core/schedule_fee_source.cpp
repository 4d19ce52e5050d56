#include "schedule_fee_source.hpp"
#include "fee_aggregator.hpp"
#include <algorithm>
#include <limits>
#include <utility>

namespace fee_estimator {

namespace {

int64_t units_for(const std::string& name, const TransactionSummary& tx) {
    if (name == "SIGNATURES") return tx.signature_count;
    if (name == "BYTES") return tx.size_bytes;
    if (name == "KEYS") return tx.key_count;
    return 0;
}

} // namespace

ScheduleFeeSource::ScheduleFeeSource(FeeScheduleConfig schedule)
    : schedule_(std::move(schedule)) {}

FeeEstimate ScheduleFeeSource::price_component(const ComponentSchedule& component,
                                               const TransactionSummary& tx) const {
    FeeEstimate estimate;
    estimate.base = component.base;
    for (const auto& rule : component.extras) {
        FeeExtra extra;
        extra.name = rule.name;
        extra.included = rule.included;
        extra.count = units_for(rule.name, tx);
        extra.fee_per_unit = rule.fee_per_unit;
        if (extra.count < 0 || extra.included < 0 || extra.fee_per_unit < 0) {
            throw InvalidFeeComponent("extra '" + rule.name + "' has a negative count, allowance or price");
        }
        extra.charged = std::max<int64_t>(0, extra.count - extra.included);
        if (extra.fee_per_unit != 0 &&
            extra.charged > std::numeric_limits<int64_t>::max() / extra.fee_per_unit) {
            throw InvalidFeeComponent("extra '" + rule.name + "' overflows");
        }
        extra.subtotal = extra.charged * extra.fee_per_unit;
        estimate.extras.push_back(extra);
    }
    return estimate;
}

FeeEstimateResponse ScheduleFeeSource::estimate(const TransactionSummary& tx, FeeEstimateMode mode) {
    auto kind = kind_to_string(tx.kind);
    auto it = schedule_.services.find(kind);
    if (it == schedule_.services.end()) {
        throw InvalidFeeComponent("no service schedule for " + kind);
    }

    FeeBreakdown breakdown;
    breakdown.mode = mode;
    breakdown.network_multiplier = schedule_.network_multiplier;
    breakdown.node = price_component(schedule_.node, tx);
    breakdown.service = price_component(it->second, tx);
    if (mode == FeeEstimateMode::STATE) {
        breakdown.notes.push_back("local fee schedule does not consult ledger state");
    }
    return derive_response(breakdown);
}

} // namespace fee_estimator
