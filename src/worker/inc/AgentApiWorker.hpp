#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

#include "WorkerClient.hpp"

struct HttpReply {
    unsigned status_code = 0;
    std::string body;
};

// Worker speaking the agentapi HTTP protocol on 127.0.0.1:<port>.
//   GET  /status   -> {"status": "running" | "stable"}
//   POST /message  <- {"content": ..., "type": "user"}
class AgentApiWorker : public WorkerClient {
public:
    // pid <= 0 attaches to an already running server without owning a process
    AgentApiWorker(int port, pid_t pid, std::chrono::milliseconds request_timeout = std::chrono::seconds(30));
    ~AgentApiWorker() override;

    std::optional<WorkerStatus> poll_status() override;
    void dispatch(const std::string& payload) override;
    void stop() noexcept override;
    int port() const override { return port_; }

    // Raw status string for monitoring, nullopt if unreachable
    std::optional<std::string> status_text();

    static std::optional<WorkerStatus> parse_status(const std::string& body);

private:
    HttpReply request(bool post, const std::string& target, const std::string& body) const;
    bool process_exited();

    const std::string host_ = "127.0.0.1";
    int port_;
    pid_t pid_;
    std::chrono::milliseconds request_timeout_;
    std::mutex process_mutex_;
    bool reaped_ = false;
    bool stopped_ = false;
};

class AgentApiLauncher : public WorkerLauncher {
public:
    // `{port}` in any command argument is replaced with the allocated port
    explicit AgentApiLauncher(std::vector<std::string> command, bool forward_stderr = false);

    std::shared_ptr<WorkerClient> spawn(const std::string& task_name, int port) override;

    static std::vector<std::string> expand_command(const std::vector<std::string>& command, int port);

private:
    std::vector<std::string> command_;
    bool forward_stderr_;
};
