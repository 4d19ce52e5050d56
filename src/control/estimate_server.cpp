#include "estimate_server.hpp"
#include "../core/fee_aggregator.hpp"
#include "../core/fee_estimate_query.hpp"
#include "../core/fee_json.hpp"
#include "../core/utils.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace fee_estimator {

EstimateServer::EstimateServer(std::shared_ptr<FeeSource> schedule_source,
                               std::shared_ptr<FeeSource> mirror_source,
                               const Config& cfg)
    : schedule_source_(std::move(schedule_source))
    , mirror_source_(std::move(mirror_source))
    , cfg_(cfg) {
    worker_.run();
}

drogon::HttpResponsePtr EstimateServer::unauthorized() {
    return json_resp(json{{"error", "unauthorized"}}, 401);
}

drogon::HttpResponsePtr EstimateServer::json_resp(json body, int code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

bool EstimateServer::authorize(const drogon::HttpRequestPtr& req) {
    if (cfg_.auth.token.empty()) return true;
    auto auth = req->getHeader("authorization");
    std::string expected = "Bearer " + cfg_.auth.token;
    return auth == expected;
}

void EstimateServer::aggregate(const drogon::HttpRequestPtr& req,
                               std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    try {
        auto j = json::parse(req->getBody());
        auto response = derive_response(fee_breakdown_from_json(j));
        callback(json_resp(fee_response_to_json(response)));
    } catch (const InvalidFeeComponent& e) {
        callback(json_resp(json{{"error", e.what()}, {"kind", "InvalidFeeComponent"}}, 400));
    } catch (const std::exception& e) {
        spdlog::warn("aggregate: bad request: {}", e.what());
        callback(json_resp(json{{"error", e.what()}}, 400));
    }
}

void EstimateServer::estimate(const drogon::HttpRequestPtr& req,
                              std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }

    FeeEstimateQuery query;
    try {
        auto mode_param = req->getParameter("mode");
        if (mode_param.empty()) {
            query.set_mode(cfg_.query.default_mode);
        } else {
            auto mode = mode_from_string(mode_param);
            if (!mode) {
                callback(json_resp(json{{"error", "unknown mode '" + mode_param + "'"}}, 400));
                return;
            }
            query.set_mode(*mode);
        }

        auto j = json::parse(req->getBody());
        std::string kind_name = j.value("kind", std::string{});
        auto kind = kind_from_string(kind_name);
        if (!kind) {
            callback(json_resp(json{{"error", "unknown transaction kind '" + kind_name + "'"}}, 400));
            return;
        }

        TransactionSummary tx;
        tx.kind = *kind;
        std::string hex = j.value("transaction_hex", std::string{});
        if (!hex.empty()) {
            auto bytes = utils::hex_decode(hex);
            if (!bytes) {
                callback(json_resp(json{{"error", "transaction_hex is not valid hex"}}, 400));
                return;
            }
            tx.signed_bytes = std::move(*bytes);
        }
        tx.signature_count = j.value("signatures", tx.signature_count);
        tx.size_bytes = j.value("size_bytes", static_cast<int64_t>(tx.signed_bytes.size()));
        tx.key_count = j.value("keys", tx.key_count);
        if (tx.signature_count < 0 || tx.size_bytes < 0 || tx.key_count < 0) {
            callback(json_resp(json{{"error", "signatures, size_bytes and keys must not be negative"}}, 400));
            return;
        }
        query.set_transaction(tx);
    } catch (const std::exception& e) {
        spdlog::warn("estimate: bad request: {}", e.what());
        callback(json_resp(json{{"error", e.what()}}, 400));
        return;
    }

    if (mirror_source_ && !query.transaction()->signed_bytes.empty()) {
        // The mirror node call blocks; keep it off the IO loop.
        worker_.getLoop()->queueInLoop([this, query, callback]() {
            callback(run_estimate(query, *mirror_source_, "mirror_node"));
        });
        return;
    }
    callback(run_estimate(query, *schedule_source_, "schedule"));
}

drogon::HttpResponsePtr EstimateServer::run_estimate(const FeeEstimateQuery& query, FeeSource& source,
                                                     const std::string& source_name) {
    try {
        auto body = fee_response_to_json(query.execute(source));
        body["source"] = source_name;
        return json_resp(body);
    } catch (const InvalidFeeComponent& e) {
        return json_resp(json{{"error", e.what()}, {"kind", "InvalidFeeComponent"}}, 400);
    } catch (const std::invalid_argument& e) {
        return json_resp(json{{"error", e.what()}}, 400);
    } catch (const std::exception& e) {
        spdlog::error("estimate via {} failed: {}", source_name, e.what());
        return json_resp(json{{"error", e.what()}}, 502);
    }
}

void EstimateServer::schedule(const drogon::HttpRequestPtr& req,
                              std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    callback(json_resp(fee_schedule_to_json(cfg_.fee_schedule)));
}

void EstimateServer::health(const drogon::HttpRequestPtr& req,
                            std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    (void)req;
    callback(json_resp(json{
        {"status", "ok"},
        {"mirror_node", mirror_source_ != nullptr},
        {"default_mode", mode_to_string(cfg_.query.default_mode)}
    }));
}

} // namespace fee_estimator
