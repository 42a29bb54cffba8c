#include "config.hpp"
#include "console_ui.hpp"
#include "http_server.hpp"
#include "log_pipeline.hpp"
#include "server_log.hpp"
#include "source_manager.hpp"
#include "status_probe.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <string>
#include <thread>

using namespace cerberus_dash;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        std::cout << "=== Cerberus Dashboard ===" << std::endl;
        std::cout << "Dashboard: http://127.0.0.1:" << config.port << "/" << std::endl;
        std::cout << "API:       http://127.0.0.1:" << config.port << "/api/status" << std::endl;

        LogPipeline pipeline(config.buffer_capacity);
        SourceManager sources(pipeline);
        StatusProbe status(config.services, config.hostname_file, config.backend_onion);
        HttpServer http(config, pipeline, sources, status);

        std::unique_ptr<ConsoleUI> ui;
        if (config.tui) {
            ui = std::make_unique<ConsoleUI>(pipeline, sources, status, config.port);
            ServerLog::set_sink(ui->get_log_sink());
        }

        for (const auto& source : config.sources) {
            // Optional log files are only followed when present at startup
            if (source.kind == SourceKind::File && !std::filesystem::exists(source.target)) {
                ServerLog::info("Sources", "Skipping " + source.name + ": " + source.target +
                                " does not exist");
                continue;
            }
            sources.add_source(source);
        }
        ServerLog::info("Sources", std::to_string(sources.running_count()) + " of " +
                        std::to_string(sources.list_sources().size()) + " sources attached");

        pipeline.announce(Level::Info, "Dashboard server started");
        http.start();

        if (ui) {
            ui->run(running);
        } else {
            while (running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        ServerLog::info("Main", "Shutting down...");
        http.stop();
        sources.stop_all();
        ServerLog::set_sink(nullptr);

    } catch (const std::exception& e) {
        ServerLog::set_sink(nullptr);
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
