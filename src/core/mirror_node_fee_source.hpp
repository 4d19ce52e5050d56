#pragma once

#include "fee_source.hpp"
#include "config.hpp"
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace fee_estimator {

/**
 * Asks a mirror node for fee estimates: POST <base_path>/network/fees?mode=...
 * with the signed transaction bytes as the body.
 *
 * The HTTP client runs on an event loop thread owned by this object, so
 * estimate() may block the calling thread. The loop stops and joins when the
 * source is destroyed.
 */
class MirrorNodeFeeSource : public FeeSource {
public:
    explicit MirrorNodeFeeSource(const MirrorNodeConfig& cfg);
    ~MirrorNodeFeeSource() override;

    void connect();
    void disconnect();
    bool is_connected() const { return client_ != nullptr; }

    FeeEstimateResponse estimate(const TransactionSummary& tx, FeeEstimateMode mode) override;

    std::string request_path(FeeEstimateMode mode) const;

private:
    MirrorNodeConfig cfg_;
    trantor::EventLoopThread loop_thread_{"MirrorNodeLoop"};
    drogon::HttpClientPtr client_;
    mutable std::mutex client_mutex_;  // Protects client_ from concurrent connect/disconnect
};

} // namespace fee_estimator
