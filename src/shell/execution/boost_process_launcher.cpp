/*
 * boost_process_launcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file boost_process_launcher.cpp
 * @brief Boost.Process based process launcher implementation
 * @date 2024-1-13
 */

#include "boost_process_launcher.hpp"

#include <array>
#include <filesystem>
#include <functional>
#include <system_error>

#include <spdlog/spdlog.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/process.hpp>

namespace mortar::shell {

namespace asio = boost::asio;
namespace bp = boost::process;

namespace {

/**
 * @brief Drains one async pipe into a sink until the write end closes
 */
class StreamPump {
public:
    StreamPump(bp::async_pipe& pipe, IOutputSink& sink,
               std::function<void()> onClosed)
        : pipe_(pipe), sink_(sink), onClosed_(std::move(onClosed)) {}

    void start() { readNext(); }

private:
    void readNext() {
        pipe_.async_read_some(
            asio::buffer(buffer_),
            [this](const boost::system::error_code& ec, std::size_t size) {
                if (size > 0) {
                    sink_.append(std::string_view(buffer_.data(), size));
                }
                if (ec) {
                    // EOF, or the pipe was torn down after a timeout
                    if (ec != asio::error::operation_aborted) {
                        onClosed_();
                    }
                    return;
                }
                readNext();
            });
    }

    bp::async_pipe& pipe_;
    IOutputSink& sink_;
    std::function<void()> onClosed_;
    std::array<char, 4096> buffer_{};
};

auto spawn(const LaunchRequest& request, bp::async_pipe& outPipe,
           bp::async_pipe& errPipe) -> bp::child {
    const auto& invocation = request.invocation;
#ifdef _WIN32
    return bp::child(bp::cmd = invocation.interpreter + " " +
                               invocation.commandLine(),
                     bp::start_dir = request.workingDirectory.string(),
                     bp::std_in < bp::null, bp::std_out > outPipe,
                     bp::std_err > errPipe);
#else
    return bp::child(bp::exe = invocation.interpreter,
                     bp::args = invocation.arguments(),
                     bp::start_dir = request.workingDirectory.string(),
                     bp::std_in < bp::null, bp::std_out > outPipe,
                     bp::std_err > errPipe);
#endif
}

}  // namespace

auto BoostProcessLauncher::launch(const LaunchRequest& request,
                                  IOutputSink& output, IOutputSink& errors)
    -> LaunchOutcome {
    // The child would otherwise fall back to the caller's directory
    std::error_code dirError;
    if (!std::filesystem::is_directory(request.workingDirectory, dirError)) {
        spdlog::debug("BoostProcessLauncher: working directory {} for '{}' "
                      "is not a directory",
                      request.workingDirectory.string(),
                      request.invocation.command);
        return ProcessFault{"working directory is not a directory: " +
                            request.workingDirectory.string()};
    }

    const auto startTime = std::chrono::steady_clock::now();
    auto elapsed = [&startTime] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);
    };

    asio::io_context context;

    try {
        bp::async_pipe outPipe(context);
        bp::async_pipe errPipe(context);
        bp::child child = spawn(request, outPipe, errPipe);

        spdlog::debug("BoostProcessLauncher: started pid {} for '{}' in {}",
                      child.id(), request.invocation.command,
                      request.workingDirectory.string());

        asio::steady_timer deadline(context);
        asio::steady_timer exitPoll(context);
        int openStreams = 2;
        bool finished = false;
        bool cancelled = false;
        std::string waitFailure;

        std::function<void()> pollExit = [&] {
            std::error_code ec;
            const bool running = child.running(ec);
            if (ec) {
                waitFailure = ec.message();
            }
            if (!running || ec) {
                finished = true;
                deadline.cancel();
                return;
            }
            exitPoll.expires_after(kExitPollInterval);
            exitPoll.async_wait([&](const boost::system::error_code& waitEc) {
                if (!waitEc) {
                    pollExit();
                }
            });
        };

        auto onStreamClosed = [&] {
            if (--openStreams == 0 && !cancelled) {
                pollExit();
            }
        };

        StreamPump outPump(outPipe, output, onStreamClosed);
        StreamPump errPump(errPipe, errors, onStreamClosed);

        deadline.expires_after(request.timeout);
        deadline.async_wait([&](const boost::system::error_code& ec) {
            if (ec || finished) {
                return;
            }
            cancelled = true;
            std::error_code killError;
            child.terminate(killError);
            if (killError) {
                spdlog::warn("BoostProcessLauncher: failed to kill pid {}: {}",
                             child.id(), killError.message());
            }
            // Descendants may still hold the pipes open; stop waiting on them
            context.stop();
        });

        outPump.start();
        errPump.start();
        context.run();

        if (cancelled) {
            return ProcessCancelled{elapsed()};
        }
        if (!waitFailure.empty()) {
            return ProcessFault{"failed to wait for process: " + waitFailure};
        }
        return ProcessCompleted{child.exit_code(), elapsed()};
    } catch (const bp::process_error& e) {
        spdlog::debug("BoostProcessLauncher: launch of '{}' failed: {}",
                      request.invocation.command, e.what());
        return ProcessFault{e.what()};
    } catch (const boost::system::system_error& e) {
        spdlog::debug("BoostProcessLauncher: pipe setup for '{}' failed: {}",
                      request.invocation.command, e.what());
        return ProcessFault{e.what()};
    }
}

}  // namespace mortar::shell
