#include "mirror_node_fee_source.hpp"
#include "fee_json.hpp"
#include <stdexcept>

namespace fee_estimator {

MirrorNodeFeeSource::MirrorNodeFeeSource(const MirrorNodeConfig& cfg)
    : cfg_(cfg) {
    loop_thread_.run();
}

MirrorNodeFeeSource::~MirrorNodeFeeSource() {
    disconnect();
}

void MirrorNodeFeeSource::connect() {
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_ = drogon::HttpClient::newHttpClient(cfg_.url(), loop_thread_.getLoop());
    spdlog::info("Mirror node fee source using {}{}", cfg_.url(), cfg_.base_path);
}

void MirrorNodeFeeSource::disconnect() {
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_.reset();
}

std::string MirrorNodeFeeSource::request_path(FeeEstimateMode mode) const {
    std::string base = cfg_.base_path;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/network/fees?mode=" + mode_to_string(mode);
}

FeeEstimateResponse MirrorNodeFeeSource::estimate(const TransactionSummary& tx, FeeEstimateMode mode) {
    if (tx.signed_bytes.empty()) {
        throw std::invalid_argument("mirror node estimate needs the signed transaction bytes");
    }

    drogon::HttpClientPtr client;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        client = client_;
    }
    if (!client) {
        throw std::runtime_error("mirror node fee source is not connected");
    }

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPathEncode(false);
    req->setPath(request_path(mode));
    req->setContentTypeString("application/protobuf");
    req->setBody(tx.signed_bytes);

    auto [result, resp] = client->sendRequest(req, cfg_.timeout_seconds);
    if (result != drogon::ReqResult::Ok || !resp) {
        spdlog::warn("Mirror node fee request for {} failed: result={}",
                     kind_to_string(tx.kind), static_cast<int>(result));
        throw std::runtime_error("mirror node request failed (result " +
                                 std::to_string(static_cast<int>(result)) + ")");
    }

    std::string body(resp->getBody());
    int status = static_cast<int>(resp->getStatusCode());
    if (status < 200 || status >= 300) {
        spdlog::error("Mirror node answered {} for {} fee estimate: {}", status, kind_to_string(tx.kind), body);
        throw std::runtime_error("mirror node returned HTTP " + std::to_string(status) + ": " + body);
    }

    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        spdlog::error("Mirror node fee estimate is not JSON: {}", e.what());
        throw std::runtime_error(std::string("mirror node returned invalid JSON: ") + e.what());
    }
    if (j.is_object() && (!j.contains("mode") || j["mode"].is_null())) {
        j["mode"] = mode_to_string(mode);
    }
    return fee_response_from_json(j);
}

} // namespace fee_estimator
