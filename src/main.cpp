#include "Config.hpp"
#include "Engine.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <cstdlib>
#include <memory>
#include <vector>

using namespace sqlquote;
using json = nlohmann::json;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Results go to stdout, so log to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sql-quote", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

std::string process(const Engine& engine, const OutputConfig& output, const std::string& input) {
    if (output.unquote) {
        return engine.unquote(input);
    }
    if (output.columns) {
        return engine.quoteColumns(input);
    }
    return engine.quote(input, !output.tables);
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = Config::parseArgs(argc, argv);

    setupLogging(config.debug, config.log_file);

    if (!config.validate()) {
        return EXIT_FAILURE;
    }

    std::unique_ptr<Engine> engine;
    try {
        engine = Engine::create(config);
    } catch (const std::exception& e) {
        spdlog::error("Initialization failed: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Quoting {} identifier(s) for {}", config.identifiers.size(),
                 engine->dialect().name());

    if (config.output.json) {
        json results = json::array();
        for (const auto& input : config.identifiers) {
            json entry = {{"input", input},
                          {"output", process(*engine, config.output, input)}};
            results.push_back(entry);
        }
        std::cout << results.dump(config.output.pretty_json ? 2 : -1) << std::endl;
    } else {
        for (const auto& input : config.identifiers) {
            std::cout << process(*engine, config.output, input) << '\n';
        }
        std::cout.flush();
    }

    return EXIT_SUCCESS;
}
