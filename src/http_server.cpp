#include "http_server.hpp"
#include "server_log.hpp"
#include <sstream>
#include <stdexcept>

namespace cerberus_dash {

HttpServer::HttpServer(const Config& config, LogPipeline& pipeline, SourceManager& sources,
                       StatusProbe& status)
    : server_(std::make_unique<httplib::Server>())
    , bind_address_(config.bind_address)
    , port_(config.port)
    , dashboard_dir_(config.dashboard_dir)
    , history_limit_(config.history_limit)
    , keepalive_(config.keepalive)
    , pipeline_(pipeline)
    , sources_(sources)
    , status_(status)
{
    server_->new_task_queue = [] { return new httplib::ThreadPool(kWorkerThreads); };
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::send_json(httplib::Response& res, const nlohmann::json& body) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(dump_json(body), "application/json");
}

void HttpServer::setup_routes() {
    // Log 404s and other errors
    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::stringstream msg;
        msg << res.status << " " << req.method << " " << req.path << " from " << req.remote_addr;
        ServerLog::warn("HTTP", msg.str());
    });

    // Static dashboard; "/" resolves to index.html
    if (!server_->set_mount_point("/", dashboard_dir_)) {
        ServerLog::warn("HTTP", "Dashboard directory not found: " + dashboard_dir_);
    }

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, {{"status", "ok"}});
    });

    server_->Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, status_.status_json(pipeline_));
    });

    server_->Get("/api/logs/history", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = nlohmann::json::array();
        for (const auto& entry : pipeline_.events().snapshot(history_limit_)) {
            body.push_back(entry.to_json());
        }
        send_json(res, body);
    });

    server_->Get("/api/sources", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = nlohmann::json::array();
        for (const auto& source : sources_.list_sources()) {
            body.push_back(source.to_json());
        }
        send_json(res, body);
    });

    server_->Get("/api/logs/stream", [this](const httplib::Request& req, httplib::Response& res) {
        ServerLog::info("HTTP", "Log stream opened by " + req.remote_addr);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_header("Access-Control-Allow-Origin", "*");

        res.set_chunked_content_provider(
            "text/event-stream",
            [this](size_t /*offset*/, httplib::DataSink& sink) -> bool {
                handle_stream(sink);
                sink.done();
                return true;
            }
        );
    });
}

void HttpServer::handle_stream(httplib::DataSink& sink) {
    if (!running_) return;

    uint64_t id = ++session_counter_;
    StreamingSession session(pipeline_.events(), keepalive_);
    ++active_streams_;

    try {
        session.run([&sink](const std::string& frame) {
            return sink.is_writable() && sink.write(frame.data(), frame.size());
        });
    } catch (const std::exception& e) {
        ServerLog::error("HTTP", "Log stream " + std::to_string(id) + " failed: " + e.what());
    }

    --active_streams_;
    ServerLog::info("HTTP", "Log stream " + std::to_string(id) + " closed");
}

void HttpServer::start() {
    if (running_) return;

    int bound;
    if (port_ == 0) {
        bound = server_->bind_to_any_port(bind_address_);
    } else {
        bound = server_->bind_to_port(bind_address_, port_) ? port_ : -1;
    }
    if (bound < 0) {
        throw std::runtime_error("Failed to bind " + bind_address_ + ":" + std::to_string(port_));
    }
    port_ = static_cast<uint16_t>(bound);
    running_ = true;

    thread_ = std::thread([this]() {
        ServerLog::info("HTTP", "Server listening on " + bind_address_ + ":" + std::to_string(port_));
        if (!server_->listen_after_bind()) {
            ServerLog::error("HTTP", "Server stopped unexpectedly");
        }
    });
}

void HttpServer::stop() {
    if (!running_) return;

    running_ = false;

    // Wakes every open stream; streams still connecting get a closed
    // subscription and end at once
    pipeline_.events().close_all();

    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace cerberus_dash
