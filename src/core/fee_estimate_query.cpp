#include "fee_estimate_query.hpp"
#include "fee_aggregator.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace fee_estimator {

FeeEstimateQuery& FeeEstimateQuery::set_transaction(TransactionSummary tx) {
    tx_ = std::move(tx);
    return *this;
}

FeeEstimateQuery& FeeEstimateQuery::set_mode(FeeEstimateMode mode) {
    mode_ = mode;
    return *this;
}

FeeEstimateResponse FeeEstimateQuery::execute(FeeSource& source) const {
    if (!tx_) {
        throw std::invalid_argument("fee estimate query has no transaction");
    }
    auto response = source.estimate(*tx_, mode());
    try {
        validate_response(response);
    } catch (const InvalidFeeComponent& e) {
        spdlog::warn("Rejecting {} fee estimate: {}", kind_to_string(tx_->kind), e.what());
        throw;
    }

    spdlog::debug("{} fee estimate: mode={} service_base={} node_base={} network_subtotal={} total={}",
                  kind_to_string(tx_->kind), mode_to_string(response.mode), response.service.base,
                  response.node.base, response.network.subtotal, response.total);
    return response;
}

} // namespace fee_estimator
