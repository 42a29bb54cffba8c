#pragma once

#include "config.hpp"
#include "log_pipeline.hpp"
#include "source_manager.hpp"
#include "status_probe.hpp"
#include "stream_session.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace cerberus_dash {

class HttpServer {
public:
    // Worker threads; every open log stream holds one for its lifetime
    static constexpr size_t kWorkerThreads = 64;

    HttpServer(const Config& config, LogPipeline& pipeline, SourceManager& sources,
               StatusProbe& status);
    ~HttpServer();

    // Binds synchronously (throws std::runtime_error if the port is taken),
    // then serves on a background thread. Port 0 picks a free port.
    void start();
    // Stops accepting connections and ends every log stream by closing the
    // pipeline's event buffer
    void stop();

    uint16_t port() const { return port_; }
    bool is_running() const { return running_; }
    size_t active_streams() const { return active_streams_; }

private:
    void setup_routes();
    void handle_stream(httplib::DataSink& sink);
    static void send_json(httplib::Response& res, const nlohmann::json& body);

    std::unique_ptr<httplib::Server> server_;
    std::string bind_address_;
    uint16_t port_;
    std::string dashboard_dir_;
    size_t history_limit_;
    std::chrono::milliseconds keepalive_;

    LogPipeline& pipeline_;
    SourceManager& sources_;
    StatusProbe& status_;

    std::thread thread_;
    std::atomic<bool> running_{false};

    std::atomic<size_t> active_streams_{0};
    std::atomic<uint64_t> session_counter_{0};
};

} // namespace cerberus_dash
