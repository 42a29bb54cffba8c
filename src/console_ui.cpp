#include "console_ui.hpp"
#include "source_manager.hpp"
#include "status_probe.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace cerberus_dash {

namespace {

std::string format_uptime(int64_t seconds) {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << seconds / 3600 << ":"
       << std::setw(2) << (seconds / 60) % 60 << ":"
       << std::setw(2) << seconds % 60;
    return ss.str();
}

} // namespace

ConsoleUI::ConsoleUI(LogPipeline& pipeline, SourceManager& sources, StatusProbe& status,
                     uint16_t http_port)
    : pipeline_(pipeline)
    , sources_(sources)
    , status_(status)
    , entries_(1000)
    , server_logs_(500)
    , http_port_(http_port)
    , rate_window_start_(std::chrono::steady_clock::now())
{
    pipeline_subscription_ = pipeline_.subscribe([this](const LogEntry& entry) {
        on_entry(entry);
    });
}

ConsoleUI::~ConsoleUI() {
    // The sink and the observer both point at this object
    ServerLog::set_sink(nullptr);
    pipeline_.unsubscribe(pipeline_subscription_);
    if (status_thread_.joinable()) {
        status_thread_.join();
    }
}

void ConsoleUI::on_entry(const LogEntry& entry) {
    entries_in_window_++;
    if (paused_) return;

    entries_.push(entry);

    if (auto* screen = screen_.load()) {
        screen->Post(ftxui::Event::Custom);
    }
}

void ConsoleUI::log_server(const std::string& component,
                           const std::string& message, Severity severity) {
    server_logs_.push(ServerLogLine{component, message, severity});

    if (auto* screen = screen_.load()) {
        screen->Post(ftxui::Event::Custom);
    }
}

ServerLog::Sink ConsoleUI::get_log_sink() {
    return [this](const std::string& component, const std::string& msg, Severity severity) {
        this->log_server(component, msg, severity);
    };
}

ftxui::Color ConsoleUI::level_to_color(Level level) {
    using namespace ftxui;
    switch (level) {
        case Level::Error:
            return Color::Red;
        case Level::Warn:
            return Color::Yellow;
        case Level::Debug:
            return Color::GrayDark;
        case Level::Info:
        default:
            return Color::White;
    }
}

void ConsoleUI::update_stats() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - rate_window_start_).count();
    if (elapsed < 1) return;

    double rate = static_cast<double>(entries_in_window_.exchange(0)) / elapsed;
    rate_window_start_ = now;

    auto wall_now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.counters = pipeline_.stats();
    stats_.buffered = pipeline_.events().size();
    stats_.viewers = pipeline_.events().subscriber_count();
    stats_.sources_running = sources_.running_count();
    stats_.sources_total = sources_.list_sources().size();
    stats_.entries_per_second = rate;
    stats_.uptime_seconds = (wall_now - pipeline_.start_time_ms()) / 1000;
}

void ConsoleUI::refresh_status() {
    if (status_thread_.joinable()) {
        status_thread_.join();
    }

    log_server("Status", "Checking services...");
    status_thread_ = std::thread([this]() {
        for (const auto& [name, state] : status_.service_status()) {
            log_server("Status", "  " + name + ": " + state,
                       state == "running" ? Severity::Info : Severity::Warn);
        }
        auto onion = status_.mirror_onion();
        log_server("Status", "  mirror: " + (onion ? *onion : std::string("(not available)")));
    });
}

void ConsoleUI::show_help() {
    log_server("Help", "Available commands:");
    for (const auto& command : commands_.commands()) {
        std::string names = "/" + command.name;
        if (!command.alias.empty()) names += ", /" + command.alias;
        names.resize(std::max<size_t>(names.size(), 18), ' ');
        log_server("Help", "  " + names + command.description);
    }
}

void ConsoleUI::init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen) {
    std::vector<SlashCommand> commands = {
        {"quit", "q", "Exit the dashboard", [&running, &screen]() {
            running = false;
            screen.Exit();
        }},
        {"pause", "p", "Freeze the stream pane", [this]() {
            paused_ = !paused_;
            log_server("Command", paused_ ? "Stream paused" : "Stream resumed");
        }},
        {"clear", "", "Clear the stream pane", [this]() {
            entries_.clear();
        }},
        {"sources", "", "List configured sources", [this]() {
            auto sources = sources_.list_sources();
            if (sources.empty()) {
                log_server("Sources", "No sources configured");
            }
            for (const auto& source : sources) {
                const auto& d = source.descriptor;
                log_server("Sources", d.name + " <- " + source_kind_to_string(d.kind) + " " + d.target +
                           (source.running ? "" : " [stopped]"),
                           source.running ? Severity::Info : Severity::Warn);
            }
        }},
        {"status", "", "Query service status", [this]() {
            refresh_status();
        }},
        {"help", "h", "Show this list", [this]() {
            show_help();
        }},
    };
    for (auto& command : commands) {
        commands_.add(std::move(command));
    }
}

void ConsoleUI::execute_command() {
    std::string input = command_input_;
    command_input_.clear();

    std::string word;
    if (commands_.execute(input, word) == CommandTable::Outcome::Unknown) {
        log_server("Command", "Unknown command /" + word + ", try /help", Severity::Error);
    }
}

void ConsoleUI::run(std::atomic<bool>& running) {
    using namespace ftxui;

    auto screen = ScreenInteractive::Fullscreen();
    screen_ = &screen;

    init_commands(running, screen);
    completion_hint_ = commands_.hint(command_input_);

    // Stats refresh; also notices shutdown requested from a signal
    std::atomic<bool> stats_running{true};
    std::thread stats_thread([this, &stats_running, &running, &screen]() {
        while (stats_running) {
            update_stats();
            if (!running) {
                screen.Exit();
                break;
            }
            screen.Post(Event::Custom);
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }
    });

    auto input_option = InputOption::Default();
    input_option.transform = [](InputState state) {
        state.element |= color(Color::White);
        return state.element;
    };
    auto input_component = Input(&command_input_, "", input_option);

    auto command_input_handler = CatchEvent(input_component, [this](Event event) {
        if (event == Event::Tab) {
            command_input_ = commands_.complete(command_input_);
        } else if (event == Event::Escape) {
            command_input_.clear();
        } else if (event == Event::Return) {
            execute_command();
        } else {
            return false;
        }
        completion_hint_ = commands_.hint(command_input_);
        return true;
        return false;
    });

    // Refresh hints once the input has consumed the keystroke
    auto command_with_hints = CatchEvent(command_input_handler, [this](Event event) {
        if (event.is_character() || event == Event::Backspace || event == Event::Delete) {
            completion_hint_ = commands_.hint(command_input_);
        }
        return false;
    });

    auto main_content = Renderer([this]() {
        DisplayStats current;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            current = stats_;
        }

        auto app_info = vbox({
            hbox({
                text(" Cerberus") | bold | color(Color::White),
                text(" Dashboard") | dim,
            }),
            text(" HTTP:" + std::to_string(http_port_) + "  up " +
                 format_uptime(current.uptime_seconds)) | dim,
        });

        auto counters = hbox({
            text("requests ") | dim,
            text(std::to_string(current.counters.requests)),
            text("  blocked ") | dim,
            text(std::to_string(current.counters.blocked)) | color(Color::Red),
            text("  captchas ") | dim,
            text(std::to_string(current.counters.captchas)) | color(Color::Yellow),
        });

        auto activity = hbox({
            text(std::to_string(static_cast<int>(current.entries_per_second)) + "/s") | dim,
            text(" │ ") | dim,
            text("sources " + std::to_string(current.sources_running) + "/" +
                 std::to_string(current.sources_total)) | dim,
            text(" │ ") | dim,
            text("viewers " + std::to_string(current.viewers)) | dim,
        });

        auto top_bar = hbox({
            app_info,
            filler(),
            vbox({counters, activity}),
            text(" "),
        });

        // Stream pane
        auto lines = entries_.tail(200);
        Elements stream_elements;
        for (const auto& entry : lines) {
            stream_elements.push_back(hbox({
                text(entry.time + " ") | dim,
                text("[" + entry.source + "] ") | color(Color::Cyan),
                text(entry.message) | color(level_to_color(entry.level)),
            }));
        }

        auto stream_pane = vbox({
            hbox({
                text(" Live Stream ") | bold,
                filler(),
                text("(" + std::to_string(current.buffered) + " buffered)") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(stream_elements)) | focusPositionRelative(0, 1) | vscroll_indicator | yframe | flex,
        }) | flex | border | color(Color::GrayDark);

        // Server logs pane
        auto server_lines = server_logs_.tail(100);
        Elements server_elements;
        for (const auto& line : server_lines) {
            auto elem = paragraph("[" + line.component + "] " + line.message);
            if (line.severity == Severity::Error) {
                elem = elem | color(Color::Red);
            } else if (line.severity == Severity::Warn) {
                elem = elem | color(Color::Yellow);
            }
            server_elements.push_back(elem);
        }

        auto server_pane = vbox({
            hbox({
                text(" Server ") | bold,
                filler(),
                text("(" + std::to_string(server_logs_.size()) + ")") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(server_elements)) | focusPositionRelative(0, 1) | vscroll_indicator | yframe | flex,
        }) | flex | border | color(Color::GrayDark);

        return vbox({
            text(""),
            top_bar,
            hbox({
                stream_pane | flex,
                server_pane | size(WIDTH, EQUAL, 44),
            }) | flex,
        });
    });

    auto cmd_bar = Renderer(command_with_hints, [this, &input_component]() {
        return hbox({
            text(" > ") | bold | color(Color::GrayLight),
            input_component->Render() | size(WIDTH, GREATER_THAN, 20),
            filler(),
            paused_ ? (text(" PAUSED ") | bgcolor(Color::Yellow) | color(Color::Black)) : text(""),
            text(completion_hint_) | dim | color(Color::GrayDark),
            text(" "),
        });
    });

    auto main_layout = Renderer(command_with_hints, [&main_content, &cmd_bar]() {
        return vbox({
            main_content->Render() | flex,
            separator() | color(Color::GrayDark),
            cmd_bar->Render() | size(HEIGHT, EQUAL, 1),
            text(""),
        });
    });

    screen.Loop(main_layout);

    stats_running = false;
    stats_thread.join();
    screen_ = nullptr;
    running = false;
}

} // namespace cerberus_dash
