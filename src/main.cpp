#include <spdlog/spdlog.h>
#include <drogon/drogon.h>
#include "core/config.hpp"
#include "core/schedule_fee_source.hpp"
#include "core/mirror_node_fee_source.hpp"
#include "control/estimate_server.hpp"

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    fee_estimator::Config cfg;
    try {
        fee_estimator::load_config(cfg, config_path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse config {}: {}", config_path, e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(cfg.logging.level));
    spdlog::info("Fee estimator starting. port={} bind={} default_mode={}",
                 cfg.service.port, cfg.service.bind_address,
                 fee_estimator::mode_to_string(cfg.query.default_mode));

    auto schedule_source = std::make_shared<fee_estimator::ScheduleFeeSource>(cfg.fee_schedule);

    std::shared_ptr<fee_estimator::MirrorNodeFeeSource> mirror_source;
    if (cfg.mirror_node.enabled) {
        try {
            mirror_source = std::make_shared<fee_estimator::MirrorNodeFeeSource>(cfg.mirror_node);
            mirror_source->connect();
        } catch (const std::exception& e) {
            spdlog::warn("Mirror node unavailable, estimating from local schedule only: {}", e.what());
            mirror_source.reset();
        }
    }

    auto server = std::make_shared<fee_estimator::EstimateServer>(schedule_source, mirror_source, cfg);
    drogon::app().addListener(cfg.service.bind_address, cfg.service.port);
    drogon::app().registerController(server);
    spdlog::info("Starting Drogon listener on {}:{}", cfg.service.bind_address, cfg.service.port);
    drogon::app().run();
    return 0;
}
