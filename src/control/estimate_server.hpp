#pragma once

#include <memory>
#include <string>
#include <drogon/HttpController.h>
#include <nlohmann/json.hpp>
#include <trantor/net/EventLoopThread.h>
#include "../core/config.hpp"
#include "../core/fee_estimate_query.hpp"
#include "../core/fee_source.hpp"

namespace fee_estimator {

class EstimateServer : public drogon::HttpController<EstimateServer> {
public:
    static const bool isAutoCreation = false;
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(EstimateServer::aggregate, "/api/v1/fees/aggregate", drogon::Post);
    ADD_METHOD_TO(EstimateServer::estimate, "/api/v1/fees/estimate", drogon::Post);
    ADD_METHOD_TO(EstimateServer::schedule, "/api/v1/fees/schedule", drogon::Get);
    ADD_METHOD_TO(EstimateServer::health, "/health", drogon::Get);
    METHOD_LIST_END

    // mirror_source may be null; estimates then always use the local schedule.
    EstimateServer(std::shared_ptr<FeeSource> schedule_source,
                   std::shared_ptr<FeeSource> mirror_source,
                   const Config& cfg);

    // HTTP handlers
    void aggregate(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void estimate(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void schedule(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void health(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);

private:
    drogon::HttpResponsePtr unauthorized();
    drogon::HttpResponsePtr json_resp(nlohmann::json body, int code = 200);
    bool authorize(const drogon::HttpRequestPtr& req);
    drogon::HttpResponsePtr run_estimate(const FeeEstimateQuery& query, FeeSource& source,
                                         const std::string& source_name);

    std::shared_ptr<FeeSource> schedule_source_;
    std::shared_ptr<FeeSource> mirror_source_;
    Config cfg_;
    // Runs mirror node estimates; declared last so it stops before the sources go.
    trantor::EventLoopThread worker_{"EstimateWorker"};
};

} // namespace fee_estimator
