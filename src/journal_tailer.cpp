#include "journal_tailer.hpp"
#include "log_normalizer.hpp"
#include "server_log.hpp"
#include <istream>
#include <system_error>

namespace cerberus_dash {

CommandTailer::CommandTailer(const std::string& name, std::vector<std::string> command,
                             LineSink sink)
    : SourceTailer(name, command.empty() ? std::string() : command.front(), std::move(sink))
    , command_(std::move(command))
    , stdout_(io_context_)
    , buffer_(kMaxLineBytes)
{
}

CommandTailer::CommandTailer(const std::string& name, const std::string& target,
                             std::vector<std::string> command, LineSink sink)
    : SourceTailer(name, target, std::move(sink))
    , command_(std::move(command))
    , stdout_(io_context_)
    , buffer_(kMaxLineBytes)
{
}

CommandTailer::~CommandTailer() {
    stop();
}

void CommandTailer::start() {
    if (running_ || thread_.joinable()) return;

    try {
        child_ = spawn_process(command_);
    } catch (const std::system_error& e) {
        ServerLog::error("JournalTailer", "Error tailing " + name_ + ": " + e.what());
        return;
    }

    stdout_.assign(child_.stdout_fd);
    child_.stdout_fd = -1;  // Owned by the descriptor now

    running_ = true;
    ServerLog::info("JournalTailer", "Started tailing: " + target_ + " (as " + name_ + ")");

    start_read();
    thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            ServerLog::error("JournalTailer", "Error tailing " + name_ + ": " + e.what());
        }
        running_ = false;
    });
}

void CommandTailer::stop() {
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
        ServerLog::info("JournalTailer", "Stopped tailing: " + target_);
    }

    asio::error_code ignored;
    stdout_.close(ignored);
    terminate_process(child_);
    running_ = false;
}

void CommandTailer::start_read() {
    asio::async_read_until(stdout_, buffer_, '\n',
        [this](const asio::error_code& error, std::size_t bytes) {
            handle_read(error, bytes);
        }
    );
}

void CommandTailer::handle_read(const asio::error_code& error, std::size_t bytes) {
    if (error == asio::error::not_found) {
        // Buffer full without a newline: deliver what we have and keep reading
        std::string piece(asio::buffers_begin(buffer_.data()), asio::buffers_end(buffer_.data()));
        buffer_.consume(buffer_.size());
        emit(piece);
        start_read();
        return;
    }

    if (error) {
        if (error == asio::error::eof) {
            ServerLog::warn("JournalTailer", "Source " + name_ + " closed its output");
        } else if (error != asio::error::operation_aborted) {
            ServerLog::error("JournalTailer", "Read failed for " + name_ + ": " + error.message());
        }
        if (error != asio::error::operation_aborted) {
            asio::error_code ignored;
            stdout_.close(ignored);
            terminate_process(child_);
        }
        return;  // No more work; the io_context thread exits
    }

    std::istream stream(&buffer_);
    std::string line;
    std::getline(stream, line);
    (void)bytes;

    if (!trim(line).empty()) {
        emit(line);
    }

    start_read();
}

JournalTailer::JournalTailer(const std::string& name, const std::string& unit, LineSink sink)
    : CommandTailer(name, unit, journal_command(unit), std::move(sink))
{
}

std::vector<std::string> JournalTailer::journal_command(const std::string& unit) {
    return {"journalctl", "-u", unit, "-f", "-n", "0", "--no-pager"};
}

} // namespace cerberus_dash
