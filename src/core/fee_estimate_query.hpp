#pragma once

#include <optional>
#include "fee_source.hpp"

namespace fee_estimator {

/**
 * Fee estimate request for a single submitted transaction.
 *
 *   auto response = FeeEstimateQuery()
 *       .set_transaction(tx)
 *       .set_mode(FeeEstimateMode::INTRINSIC)
 *       .execute(source);
 *
 * execute() rejects answers whose totals do not add up with
 * InvalidFeeComponent.
 */
class FeeEstimateQuery {
public:
    FeeEstimateQuery& set_transaction(TransactionSummary tx);
    FeeEstimateQuery& set_mode(FeeEstimateMode mode);

    // STATE unless set_mode() was called.
    FeeEstimateMode mode() const { return mode_.value_or(FeeEstimateMode::STATE); }
    const std::optional<TransactionSummary>& transaction() const { return tx_; }

    FeeEstimateResponse execute(FeeSource& source) const;

private:
    std::optional<TransactionSummary> tx_;
    std::optional<FeeEstimateMode> mode_;
};

} // namespace fee_estimator
