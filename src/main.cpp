#include <spdlog/spdlog.h>
#include <drogon/drogon.h>
#include "core/config.hpp"
#include "core/fmp_client.hpp"
#include "control/cors.hpp"
#include "control/fetch_controller.hpp"

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    income_api::Config cfg;
    try {
        income_api::load_config(cfg, config_path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config {}: {}", config_path, e.what());
        return 1;
    }
    income_api::load_dotenv(".env");
    income_api::apply_env(cfg);

    spdlog::set_level(income_api::log_level_from_string(cfg.logging.level));
    spdlog::info("Income statement service starting. port={} bind={}",
                 cfg.services.port, cfg.services.bind_address);

    if (cfg.upstream.api_key.empty()) {
        spdlog::error("API_KEY is not set (environment, .env or upstream.api_key)");
        return 1;
    }

    auto upstream = std::make_shared<income_api::FmpClient>(cfg.upstream);
    auto fetch_ctrl = std::make_shared<income_api::FetchController>(upstream);

    drogon::app().addListener(cfg.services.bind_address, cfg.services.port);
    if (cfg.services.threads > 0) {
        drogon::app().setThreadNum(cfg.services.threads);
    }
    income_api::install_cors(drogon::app());
    drogon::app().registerController(fetch_ctrl);
    spdlog::info("Starting Drogon listener on {}:{}",
                 cfg.services.bind_address, cfg.services.port);
    drogon::app().run();
    return 0;
}
