#pragma once

#include <memory>
#include <optional>
#include <string>

enum class WorkerStatus {
    Busy,  // Processing a payload
    Idle   // Ready for input
};

const char* to_string(WorkerStatus status);

// Handle to one running worker process
class WorkerClient {
public:
    virtual ~WorkerClient() = default;

    // nullopt when the worker could not be reached or answered garbage
    virtual std::optional<WorkerStatus> poll_status() = 0;

    // Throws std::runtime_error when the payload was not accepted
    virtual void dispatch(const std::string& payload) = 0;

    // Releases the worker. Idempotent, callable from any thread.
    virtual void stop() noexcept = 0;

    virtual int port() const = 0;
};

class WorkerLauncher {
public:
    virtual ~WorkerLauncher() = default;

    // Throws std::runtime_error when the worker could not be started
    virtual std::shared_ptr<WorkerClient> spawn(const std::string& task_name, int port) = 0;
};
