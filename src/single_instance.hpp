#pragma once

#include "interfaces/i_instance_guard.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace statisfy {

// Cross-process single-instance guard.
//
// The primary holds an exclusive flock() on "<runtime_dir>/<identity>.lock"
// and listens on the Unix socket "<runtime_dir>/<identity>.sock". A secondary
// that fails to take the lock sends its LaunchInvocation over the socket and
// waits for the primary's acknowledgement.
class SingleInstance : public IInstanceGuard {
public:
    SingleInstance(std::string identity,
                   std::filesystem::path runtime_dir,
                   std::chrono::milliseconds handoff_timeout = std::chrono::milliseconds(2000));
    ~SingleInstance() override;

    SingleInstance(const SingleInstance&) = delete;
    SingleInstance& operator=(const SingleInstance&) = delete;

    InstanceRole acquire(const LaunchInvocation& invocation) override;
    void set_handoff_callback(HandoffCallback callback) override;

    [[nodiscard]] bool is_primary() const { return primary_; }
    [[nodiscard]] bool is_listening() const { return running_; }
    [[nodiscard]] const std::filesystem::path& socket_path() const { return socket_path_; }
    [[nodiscard]] const std::filesystem::path& lock_path() const { return lock_path_; }

private:
    enum class LockState {
        Acquired,
        HeldElsewhere,
        Unavailable  // lock file could not be opened or locked
    };

    LockState try_lock();
    InstanceRole become_primary();
    InstanceRole acquire_unguarded(const LaunchInvocation& invocation);
    void start_server();
    bool send_handoff(const LaunchInvocation& invocation) const;
    void listen_thread();
    void handle_client(int client_fd);
    void deliver(LaunchInvocation invocation);

    std::string identity_;
    std::filesystem::path runtime_dir_;
    std::filesystem::path lock_path_;
    std::filesystem::path socket_path_;
    std::chrono::milliseconds handoff_timeout_;

    int lock_fd_ = -1;
    int server_fd_ = -1;
    bool primary_ = false;
    bool socket_bound_ = false;
    std::thread listener_;
    std::atomic<bool> running_{false};

    // Guards callback and the invocations received before it was set
    std::mutex callback_mutex_;
    HandoffCallback handoff_callback_;
    std::vector<LaunchInvocation> pending_;
};

} // namespace statisfy
