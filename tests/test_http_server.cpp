#include <catch2/catch_test_macros.hpp>
#include "http_server.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace cerberus_dash;
using namespace std::chrono_literals;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() /
            ("cerberus_dash_" + std::to_string(::getpid()) + "_" + name)).string();
}

StatusProbe::CommandRunner all_active() {
    return [](const std::vector<std::string>&, std::chrono::milliseconds) {
        CommandResult result;
        result.exit_code = 0;
        result.output = "active\n";
        return std::optional<CommandResult>(result);
    };
}

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

// Server on an ephemeral loopback port with a static dashboard directory
struct TestServer {
    Config config;
    LogPipeline pipeline{10};
    SourceManager sources{pipeline};
    StatusProbe status;
    std::unique_ptr<HttpServer> http;

    TestServer()
        : config(make_config())
        , status({"tor", "redis-server"}, temp_path("no_hostname"), "backend.onion", all_active())
    {
        std::filesystem::create_directories(config.dashboard_dir);
        std::ofstream(config.dashboard_dir + "/index.html") << "<html>Cerberus</html>";

        http = std::make_unique<HttpServer>(config, pipeline, sources, status);
        http->start();
    }

    ~TestServer() {
        http->stop();
        sources.stop_all();
        std::filesystem::remove_all(config.dashboard_dir);
    }

    static Config make_config() {
        Config config;
        config.port = 0;
        config.bind_address = "127.0.0.1";
        config.dashboard_dir = temp_path("dashboard");
        config.history_limit = 2;
        config.keepalive = 50ms;
        return config;
    }

    httplib::Client client() const {
        httplib::Client cli("127.0.0.1", http->port());
        cli.set_read_timeout(5, 0);
        return cli;
    }
};

// Payloads of the "data:" frames in an SSE body
std::vector<nlohmann::json> data_frames(const std::string& body) {
    std::vector<nlohmann::json> frames;
    size_t pos = 0;
    while ((pos = body.find("data: ", pos)) != std::string::npos) {
        size_t end = body.find("\n\n", pos);
        if (end == std::string::npos) break;
        frames.push_back(nlohmann::json::parse(body.substr(pos + 6, end - pos - 6)));
        pos = end + 2;
    }
    return frames;
}

} // namespace

TEST_CASE("Server binds an ephemeral port", "[http]") {
    TestServer server;
    REQUIRE(server.http->is_running());
    REQUIRE(server.http->port() != 0);

    auto cli = server.client();
    auto res = cli.Get("/health");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(nlohmann::json::parse(res->body)["status"] == "ok");
}

TEST_CASE("Static dashboard", "[http]") {
    TestServer server;
    auto cli = server.client();

    auto index = cli.Get("/");
    REQUIRE(index);
    REQUIRE(index->status == 200);
    REQUIRE(index->body.find("Cerberus") != std::string::npos);

    auto missing = cli.Get("/no-such-page.html");
    REQUIRE(missing);
    REQUIRE(missing->status == 404);
}

TEST_CASE("History endpoint", "[http]") {
    TestServer server;
    server.pipeline.ingest("10:00:01 first", "tor");
    server.pipeline.ingest("10:00:02 second warning", "tor");
    server.pipeline.ingest("10:00:03 third error", "nginx");

    auto res = server.client().Get("/api/logs/history");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->get_header_value("Access-Control-Allow-Origin") == "*");
    REQUIRE(res->get_header_value("Content-Type") == "application/json");

    auto body = nlohmann::json::parse(res->body);
    REQUIRE(body.is_array());
    REQUIRE(body.size() == 2);
    REQUIRE(body[0]["time"] == "10:00:02");
    REQUIRE(body[0]["level"] == "warn");
    REQUIRE(body[1]["source"] == "nginx");
    REQUIRE(body[1]["level"] == "error");
}

TEST_CASE("History of an empty buffer", "[http]") {
    TestServer server;
    auto res = server.client().Get("/api/logs/history");
    REQUIRE(res);
    REQUIRE(nlohmann::json::parse(res->body) == nlohmann::json::array());
}

TEST_CASE("Status endpoint", "[http]") {
    TestServer server;
    server.pipeline.ingest("captcha request", "fortify");

    auto res = server.client().Get("/api/status");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->get_header_value("Access-Control-Allow-Origin") == "*");

    auto body = nlohmann::json::parse(res->body);
    REQUIRE(body["services"]["tor"] == "running");
    REQUIRE(body["services"]["redis"] == "running");
    REQUIRE(body["mirror_onion"].is_null());
    REQUIRE(body["backend_onion"] == "backend.onion");
    REQUIRE(body["stats"]["requests"] == 1);
    REQUIRE(body["stats"]["captchas"] == 1);
    REQUIRE(body["start_time"] == server.pipeline.start_time_ms());
}

TEST_CASE("Sources endpoint reports failed sources without failing", "[http]") {
    TestServer server;
    REQUIRE_FALSE(server.sources.add_source({"ghost", SourceKind::File, temp_path("absent.log")}));

    auto res = server.client().Get("/api/sources");
    REQUIRE(res);
    REQUIRE(res->status == 200);

    auto body = nlohmann::json::parse(res->body);
    REQUIRE(body.size() == 1);
    REQUIRE(body[0]["name"] == "ghost");
    REQUIRE(body[0]["kind"] == "file");
    REQUIRE(body[0]["running"] == false);

    // Everything else keeps serving
    auto health = server.client().Get("/health");
    REQUIRE(health);
    REQUIRE(health->status == 200);
}

TEST_CASE("Log stream delivers live entries", "[http][stream]") {
    TestServer server;
    server.pipeline.ingest("backlog entry", "tor");

    std::thread producer([&server]() {
        if (wait_until([&server]() { return server.pipeline.events().subscriber_count() == 1; })) {
            server.pipeline.ingest("10:20:30 live request", "nginx");
        }
    });

    std::string body;
    std::string content_type;
    auto cli = server.client();
    cli.Get("/api/logs/stream",
        [&content_type](const httplib::Response& response) {
            content_type = response.get_header_value("Content-Type");
            return true;
        },
        [&body](const char* data, size_t length) {
            body.append(data, length);
            return body.find("live request") == std::string::npos;
        });
    producer.join();

    REQUIRE(content_type == "text/event-stream");

    auto frames = data_frames(body);
    REQUIRE(frames.size() >= 2);
    REQUIRE(frames.front()["source"] == "dashboard");
    REQUIRE(frames.front()["message"] == "Connected to log stream");
    REQUIRE(frames.back()["source"] == "nginx");
    REQUIRE(frames.back()["time"] == "10:20:30");

    // Only entries published after the connection are streamed
    REQUIRE(body.find("backlog entry") == std::string::npos);

    // The dropped connection is noticed on the next write
    REQUIRE(wait_until([&server]() { return server.http->active_streams() == 0; }));
}

TEST_CASE("Idle streams receive keepalives", "[http][stream]") {
    TestServer server;

    std::string body;
    auto cli = server.client();
    cli.Get("/api/logs/stream", [&body](const char* data, size_t length) {
        body.append(data, length);
        return body.find(": keepalive\n\n") == std::string::npos;
    });

    REQUIRE(body.find("data: ") == 0);
    REQUIRE(body.find(": keepalive\n\n") != std::string::npos);
}

TEST_CASE("Concurrent streams each get every entry", "[http][stream]") {
    TestServer server;
    constexpr int kClients = 3;

    std::vector<std::string> bodies(kClients);
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&server, &bodies, i]() {
            auto cli = server.client();
            cli.Get("/api/logs/stream", [&bodies, i](const char* data, size_t length) {
                bodies[i].append(data, length);
                return bodies[i].find("entry 2") == std::string::npos;
            });
        });
    }

    REQUIRE(wait_until([&server]() {
        return server.pipeline.events().subscriber_count() == kClients;
    }));
    for (int n = 0; n < 3; ++n) {
        server.pipeline.ingest("entry " + std::to_string(n), "tor");
    }
    for (auto& t : clients) t.join();

    for (const auto& body : bodies) {
        auto frames = data_frames(body);
        REQUIRE(frames.size() == 4);
        REQUIRE(frames[1]["message"] == "entry 0");
        REQUIRE(frames[2]["message"] == "entry 1");
        REQUIRE(frames[3]["message"] == "entry 2");
    }
}

TEST_CASE("Stopping the server closes open streams", "[http][stream]") {
    TestServer server;

    std::atomic<bool> finished{false};
    std::thread client([&server, &finished]() {
        auto cli = server.client();
        cli.Get("/api/logs/stream", [](const char*, size_t) { return true; });
        finished = true;
    });

    REQUIRE(wait_until([&server]() { return server.pipeline.events().subscriber_count() == 1; }));
    REQUIRE(server.http->active_streams() == 1);

    auto start = std::chrono::steady_clock::now();
    server.http->stop();
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE_FALSE(server.http->is_running());
    REQUIRE(server.http->active_streams() == 0);
    REQUIRE(server.pipeline.events().is_closed());

    client.join();
    REQUIRE(finished);
}

TEST_CASE("History with bytes that are not valid UTF-8", "[http][malformed]") {
    TestServer server;
    server.pipeline.ingest("10:00:01 nginx: GET /caf\xe9 request", "nginx");
    server.pipeline.ingest("tor: bad \xff byte", "tor");

    auto res = server.client().Get("/api/logs/history");
    REQUIRE(res);
    REQUIRE(res->status == 200);

    auto body = nlohmann::json::parse(res->body);
    REQUIRE(body.size() == 2);
    REQUIRE(body[0]["message"] == "10:00:01 nginx: GET /caf\xEF\xBF\xBD request");
    REQUIRE(body[1]["message"] == "tor: bad \xEF\xBF\xBD byte");
}

TEST_CASE("Log stream survives bytes that are not valid UTF-8", "[http][stream][malformed]") {
    TestServer server;

    std::thread producer([&server]() {
        if (wait_until([&server]() { return server.pipeline.events().subscriber_count() == 1; })) {
            server.pipeline.ingest("caf\xe9", "nginx");
            server.pipeline.ingest("still streaming", "nginx");
        }
    });

    std::string body;
    auto cli = server.client();
    cli.Get("/api/logs/stream", [&body](const char* data, size_t length) {
        body.append(data, length);
        return body.find("still streaming") == std::string::npos;
    });
    producer.join();

    auto frames = data_frames(body);
    REQUIRE(frames.size() == 3);
    REQUIRE(frames[1]["message"] == "caf\xEF\xBF\xBD");
    REQUIRE(frames[2]["message"] == "still streaming");

    // The server is still healthy afterwards
    auto health = server.client().Get("/health");
    REQUIRE(health);
    REQUIRE(health->status == 200);
}
