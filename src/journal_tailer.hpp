#pragma once

#include "process.hpp"
#include "source_tailer.hpp"
#include <asio.hpp>
#include <string>
#include <thread>
#include <vector>

namespace cerberus_dash {

// Follows the stdout of a long-running command, one line per entry.
class CommandTailer : public SourceTailer {
public:
    CommandTailer(const std::string& name, std::vector<std::string> command, LineSink sink);
    ~CommandTailer() override;

    void start() override;
    void stop() override;
    SourceKind kind() const override { return SourceKind::Journal; }

    const std::vector<std::string>& command() const { return command_; }

protected:
    CommandTailer(const std::string& name, const std::string& target,
                  std::vector<std::string> command, LineSink sink);

private:
    void start_read();
    void handle_read(const asio::error_code& error, std::size_t bytes);

    std::vector<std::string> command_;
    ChildProcess child_;
    asio::io_context io_context_;
    asio::posix::stream_descriptor stdout_;
    asio::streambuf buffer_;
    std::thread thread_;
};

// `journalctl -u <unit> -f -n 0 --no-pager`: new journal lines only, no backlog.
class JournalTailer : public CommandTailer {
public:
    JournalTailer(const std::string& name, const std::string& unit, LineSink sink);

    static std::vector<std::string> journal_command(const std::string& unit);
};

} // namespace cerberus_dash
