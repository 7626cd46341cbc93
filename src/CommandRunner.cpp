#include "CommandRunner.h"
#include "Logger.h"
#include <algorithm>
#include <array>
#include <functional>
#include <system_error>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <boost/process/async_pipe.hpp>

namespace bp = boost::process;

std::unique_ptr<CommandRunner> CommandRunner::create() {
    return std::make_unique<ProcessCommandRunner>();
}

ProcessCommandRunner::ProcessCommandRunner(size_t max_output_bytes)
    : m_max_output_bytes(max_output_bytes) {}

CommandResult ProcessCommandRunner::run(const std::string& program,
                                        const std::vector<std::string>& args,
                                        std::chrono::seconds timeout) {
    CommandResult result;

    auto exe = bp::search_path(program);
    if (exe.empty()) {
        Logger::info("Command not available: " + program);
        return result;
    }

    try {
        boost::asio::io_context ios;
        bp::async_pipe pipe(ios);
        bp::child child(exe, bp::args(args),
                        bp::std_in.close(),
                        bp::std_out > pipe,
                        bp::std_err > bp::null,
                        ios);
        result.launched = true;

        // Вывод копится не больше m_max_output_bytes: как только лимит
        // превышен, процесс останавливается, а остаток не читается
        std::array<char, 4096> chunk;
        std::function<void(const boost::system::error_code&, size_t)> on_read;
        on_read = [&](const boost::system::error_code& ec, size_t n) {
            const size_t room = m_max_output_bytes - result.output.size();
            result.output.append(chunk.data(), std::min(n, room));
            if (n > room) {
                result.truncated = true;
                std::error_code tec;
                child.terminate(tec);
                boost::system::error_code cec;
                pipe.close(cec);
                ios.stop();
                return;
            }
            if (ec) return;  // EOF
            pipe.async_read_some(boost::asio::buffer(chunk), on_read);
        };
        pipe.async_read_some(boost::asio::buffer(chunk), on_read);

        // run_for returns early once the child exited and stdout hit EOF
        ios.run_for(timeout);
        if (result.truncated) {
            Logger::warn("Command output exceeded " + std::to_string(m_max_output_bytes)
                         + " bytes, stopped: " + program);
            return result;
        }
        if (!ios.stopped()) {
            std::error_code ec;
            child.terminate(ec);
            result.timed_out = true;
            Logger::warn("Command timed out after " + std::to_string(timeout.count())
                         + "s: " + program);
            return result;
        }

        std::error_code ec;
        child.wait(ec);
        result.exit_code = child.exit_code();
    }
    catch (const std::exception& e) {
        Logger::warn("Command failed: " + program + " - " + e.what());
        result.launched = false;
    }
    return result;
}
