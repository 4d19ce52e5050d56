#pragma once

#include "fee_types.hpp"
#include "transaction.hpp"

namespace fee_estimator {

/**
 * Produces the raw fee breakdown for one transaction. Implementations may
 * block (network I/O); the returned response is checked by the caller.
 */
class FeeSource {
public:
    virtual ~FeeSource() = default;

    virtual FeeEstimateResponse estimate(const TransactionSummary& tx, FeeEstimateMode mode) = 0;
};

} // namespace fee_estimator
