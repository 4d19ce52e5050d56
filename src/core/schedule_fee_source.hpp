#pragma once

#include "fee_source.hpp"
#include "config.hpp"

namespace fee_estimator {

/**
 * Offline estimator backed by the configured fee schedule. It never consults
 * ledger state, so STATE and INTRINSIC requests produce the same figures.
 */
class ScheduleFeeSource : public FeeSource {
public:
    explicit ScheduleFeeSource(FeeScheduleConfig schedule);

    FeeEstimateResponse estimate(const TransactionSummary& tx, FeeEstimateMode mode) override;

    const FeeScheduleConfig& schedule() const { return schedule_; }

private:
    FeeEstimate price_component(const ComponentSchedule& component, const TransactionSummary& tx) const;

    FeeScheduleConfig schedule_;
};

} // namespace fee_estimator
