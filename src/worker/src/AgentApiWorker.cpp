#include "AgentApiWorker.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

const char* to_string(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::Busy: return "busy";
        case WorkerStatus::Idle: return "idle";
    }
    return "unknown";
}

AgentApiWorker::AgentApiWorker(int port, pid_t pid, std::chrono::milliseconds request_timeout)
    : port_(port), pid_(pid), request_timeout_(request_timeout) {}

AgentApiWorker::~AgentApiWorker() {
    stop();
}

HttpReply AgentApiWorker::request(bool post, const std::string& target, const std::string& body) const {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{post ? http::verb::post : http::verb::get, target, 11};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, "agentpipe");
    if (post) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code result_ec;

    auto const endpoints = resolver.resolve(host_, std::to_string(port_));

    // Async operations so that the stream deadline covers connect, write and read
    stream.expires_after(request_timeout_);
    stream.async_connect(endpoints, [&](beast::error_code ec, const tcp::endpoint&) {
        if (ec) {
            result_ec = ec;
            return;
        }
        http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
            if (ec) {
                result_ec = ec;
                return;
            }
            http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
                result_ec = ec;
            });
        });
    });
    ioc.run();

    if (result_ec) {
        throw std::runtime_error(target + " request failed: " + result_ec.message());
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return HttpReply{res.result_int(), res.body()};
}

bool AgentApiWorker::process_exited() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ <= 0) {
        return false;
    }
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped_ = true;
    }
    return reaped_;
}

std::optional<WorkerStatus> AgentApiWorker::parse_status(const std::string& body) {
    auto json_data = nlohmann::json::parse(body, nullptr, false);
    if (json_data.is_discarded() || !json_data.is_object() || !json_data.contains("status")
        || !json_data["status"].is_string()) {
        return std::nullopt;
    }
    const auto status = json_data["status"].get<std::string>();
    if (status == "running") return WorkerStatus::Busy;
    if (status == "stable") return WorkerStatus::Idle;
    return std::nullopt;
}

std::optional<std::string> AgentApiWorker::status_text() {
    try {
        HttpReply reply = request(false, "/status", "");
        if (reply.status_code != 200) {
            return std::nullopt;
        }
        auto json_data = nlohmann::json::parse(reply.body, nullptr, false);
        if (json_data.is_object() && json_data.contains("status") && json_data["status"].is_string()) {
            return json_data["status"].get<std::string>();
        }
    } catch (const std::exception& e) {
        LogUtils::debug("Status probe on port {} failed: {}", port_, e.what());
    }
    return std::nullopt;
}

std::optional<WorkerStatus> AgentApiWorker::poll_status() {
    if (process_exited()) {
        LogUtils::debug("Worker on port {} has exited", port_);
        return std::nullopt;
    }

    try {
        HttpReply reply = request(false, "/status", "");
        if (reply.status_code != 200) {
            LogUtils::debug("Status request on port {} returned {}: {}", port_, reply.status_code, reply.body);
            return std::nullopt;
        }
        auto status = parse_status(reply.body);
        if (!status) {
            LogUtils::debug("Unrecognized status from port {}: {}", port_, reply.body);
        }
        return status;
    } catch (const std::exception& e) {
        LogUtils::debug("Status request on port {} failed: {}", port_, e.what());
        return std::nullopt;
    }
}

void AgentApiWorker::dispatch(const std::string& payload) {
    nlohmann::json message = {
        {"content", payload},
        {"type", "user"}
    };

    HttpReply reply = request(true, "/message", message.dump());
    if (reply.status_code != 200 && reply.status_code != 202) {
        throw std::runtime_error("message request failed (" + std::to_string(reply.status_code) + "): " + reply.body);
    }
}

void AgentApiWorker::stop() noexcept {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (stopped_ || pid_ <= 0) {
        stopped_ = true;
        return;
    }
    stopped_ = true;
    if (reaped_) {
        return;
    }

    // The worker leads its own process group, take its children down with it
    if (::kill(-pid_, SIGTERM) != 0) {
        ::kill(pid_, SIGTERM);
    }

    int status = 0;
    for (int i = 0; i < 100; ++i) {
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || (r < 0 && errno == ECHILD)) {
            reaped_ = true;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LogUtils::warn("Worker pid {} ignored SIGTERM, killing it", pid_);
    ::kill(-pid_, SIGKILL);
    ::waitpid(pid_, &status, 0);
    reaped_ = true;
}

AgentApiLauncher::AgentApiLauncher(std::vector<std::string> command, bool forward_stderr)
    : command_(std::move(command)), forward_stderr_(forward_stderr) {}

std::vector<std::string> AgentApiLauncher::expand_command(const std::vector<std::string>& command, int port) {
    std::vector<std::string> argv;
    argv.reserve(command.size());
    for (auto arg : command) {
        StringUtils::replace_all(arg, "{port}", std::to_string(port));
        argv.push_back(std::move(arg));
    }
    return argv;
}

std::shared_ptr<WorkerClient> AgentApiLauncher::spawn(const std::string& task_name, int port) {
    if (command_.empty()) {
        throw std::runtime_error("worker command is empty");
    }

    std::vector<std::string> args = expand_command(command_, port);
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    // Close-on-exec pipe: the child reports exec failure through it, success closes it silently
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }

    if (child == 0) {
        ::setpgid(0, 0);
        ::close(err_pipe[0]);
        int null_fd = ::open("/dev/null", O_RDWR);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::dup2(null_fd, STDOUT_FILENO);
            if (!forward_stderr_) {
                ::dup2(null_fd, STDERR_FILENO);
            }
            if (null_fd > STDERR_FILENO) ::close(null_fd);
        }
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t written = ::write(err_pipe[1], &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    ::close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(child, &status, 0);
        throw std::runtime_error("failed to start " + args.front() + ": " + std::strerror(child_errno));
    }

    LogUtils::debug("Started worker for {} (pid {}): {}", task_name, child, StringUtils::join(args, " "));
    return std::make_shared<AgentApiWorker>(port, child);
}
