#include "single_instance.hpp"
#include "errors.hpp"

#include <sys/file.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace statisfy {

namespace {

constexpr std::string_view kAck = "ACK";
constexpr auto kConnectRetryInterval = std::chrono::milliseconds(25);

bool make_address(const std::filesystem::path& path, sockaddr_un& addr) {
    const auto& native = path.native();
    if (native.size() >= sizeof(addr.sun_path)) {
        return false;
    }
    addr = {};
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, native.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

void set_timeouts(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

// Reads until EOF. Fails on error, timeout or more than `limit` bytes.
bool read_all(int fd, std::string& out, size_t limit) {
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n == 0) return true;
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (out.size() + static_cast<size_t>(n) > limit) return false;
        out.append(buffer, static_cast<size_t>(n));
    }
}

} // namespace

SingleInstance::SingleInstance(std::string identity,
                               std::filesystem::path runtime_dir,
                               std::chrono::milliseconds handoff_timeout)
    : identity_(std::move(identity))
    , runtime_dir_(std::move(runtime_dir))
    , lock_path_(runtime_dir_ / (identity_ + ".lock"))
    , socket_path_(runtime_dir_ / (identity_ + ".sock"))
    , handoff_timeout_(handoff_timeout) {
}

SingleInstance::~SingleInstance() {
    running_ = false;

    if (server_fd_ >= 0) {
        // Unblock accept() before joining
        shutdown(server_fd_, SHUT_RDWR);
    }

    if (listener_.joinable()) {
        listener_.join();
    }

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }

    // Remove the socket before releasing the lock so the next primary's socket is never touched
    if (socket_bound_) {
        unlink(socket_path_.c_str());
    }

    if (lock_fd_ >= 0) {
        close(lock_fd_);  // releases the flock
        lock_fd_ = -1;
    }
}

SingleInstance::LockState SingleInstance::try_lock() {
    if (lock_fd_ >= 0) return LockState::Acquired;

    std::error_code ec;
    std::filesystem::create_directories(runtime_dir_, ec);
    if (ec) {
        spdlog::warn("Cannot create runtime directory {}: {}", runtime_dir_.string(), ec.message());
    }

    const int fd = open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        spdlog::error("Cannot open instance lock {}: {}", lock_path_.string(), strerror(errno));
        return LockState::Unavailable;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
        lock_fd_ = fd;
        return LockState::Acquired;
    }

    const int err = errno;
    close(fd);
    if (err == EWOULDBLOCK) {
        return LockState::HeldElsewhere;
    }
    spdlog::error("Cannot lock {}: {}", lock_path_.string(), strerror(err));
    return LockState::Unavailable;
}

InstanceRole SingleInstance::become_primary() {
    primary_ = true;
    start_server();
    return InstanceRole::Primary;
}

InstanceRole SingleInstance::acquire(const LaunchInvocation& invocation) {
    if (primary_) return InstanceRole::Primary;

    switch (try_lock()) {
        case LockState::Acquired:
            spdlog::debug("Acquired instance lock {}", lock_path_.string());
            return become_primary();
        case LockState::Unavailable:
            return acquire_unguarded(invocation);
        case LockState::HeldElsewhere:
            break;
    }

    if (send_handoff(invocation)) {
        spdlog::info("Another instance of {} is running, handed off {} argument(s)",
                     identity_, invocation.args.size());
        return InstanceRole::Secondary;
    }

    // The primary may have died mid-handoff; its lock dies with it
    spdlog::warn("Handoff to the running instance failed, attempting takeover");
    if (try_lock() == LockState::Acquired) {
        spdlog::info("Took over instance lock {}", lock_path_.string());
        return become_primary();
    }

    throw HandoffError(fmt::format("cannot reach the running instance of {} at {}",
                                   identity_, socket_path_.string()));
}

InstanceRole SingleInstance::acquire_unguarded(const LaunchInvocation& invocation) {
    // Without the lock the socket may belong to a live primary: use it, never replace it
    std::error_code ec;
    if (std::filesystem::exists(socket_path_, ec) && send_handoff(invocation)) {
        spdlog::info("Instance lock unavailable, handed off to the instance listening on {}",
                     socket_path_.string());
        return InstanceRole::Secondary;
    }

    spdlog::warn("Single-instance lock unavailable, continuing as primary without handoffs");
    primary_ = true;
    return InstanceRole::Primary;
}

void SingleInstance::set_handoff_callback(HandoffCallback callback) {
    std::lock_guard lock(callback_mutex_);
    handoff_callback_ = std::move(callback);
    if (!handoff_callback_) return;

    for (const auto& invocation : pending_) {
        handoff_callback_(invocation);
    }
    pending_.clear();
}

void SingleInstance::start_server() {
    sockaddr_un addr{};
    if (!make_address(socket_path_, addr)) {
        spdlog::warn("Socket path {} too long, handoffs disabled", socket_path_.string());
        return;
    }

    // We hold the lock, so any existing socket file is stale
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::warn("Cannot create handoff socket: {}", strerror(errno));
        return;
    }

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::warn("Cannot bind {}: {}", socket_path_.string(), strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return;
    }
    socket_bound_ = true;
    chmod(socket_path_.c_str(), 0600);

    if (listen(server_fd_, 16) < 0) {
        spdlog::warn("Cannot listen on {}: {}", socket_path_.string(), strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return;
    }

    running_ = true;
    listener_ = std::thread(&SingleInstance::listen_thread, this);
    spdlog::debug("Listening for handoffs on {}", socket_path_.string());
}

bool SingleInstance::send_handoff(const LaunchInvocation& invocation) const {
    sockaddr_un addr{};
    if (!make_address(socket_path_, addr)) {
        return false;
    }

    // The primary may hold the lock without listening yet
    const auto deadline = std::chrono::steady_clock::now() + handoff_timeout_;
    int fd = -1;
    while (true) {
        fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            spdlog::warn("Cannot create handoff socket: {}", strerror(errno));
            return false;
        }
        if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
            break;
        }
        close(fd);
        fd = -1;
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Cannot connect to {}: {}", socket_path_.string(), strerror(errno));
            return false;
        }
        std::this_thread::sleep_for(kConnectRetryInterval);
    }

    set_timeouts(fd, handoff_timeout_);

    if (!write_all(fd, encode_handoff(invocation))) {
        spdlog::warn("Handoff write failed: {}", strerror(errno));
        close(fd);
        return false;
    }
    shutdown(fd, SHUT_WR);

    std::string reply;
    const bool ok = read_all(fd, reply, 64) && reply == kAck;
    close(fd);
    if (!ok) {
        spdlog::warn("Running instance did not acknowledge the handoff");
    }
    return ok;
}

void SingleInstance::listen_thread() {
    while (running_) {
        const int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (!running_) {
                break; // Server was shut down
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            spdlog::error("accept() on {} failed: {}", socket_path_.string(), strerror(errno));
            break;
        }

        // One client at a time keeps handoffs in arrival order
        handle_client(client_fd);
        close(client_fd);
    }
}

void SingleInstance::handle_client(int client_fd) {
    set_timeouts(client_fd, handoff_timeout_);

    std::string frame;
    if (!read_all(client_fd, frame, kMaxHandoffFrameSize)) {
        spdlog::warn("Dropped handoff: read failed or frame too large");
        return;
    }

    auto invocation = decode_handoff(frame);
    if (!invocation) {
        spdlog::warn("Dropped malformed handoff frame ({} bytes)", frame.size());
        return;
    }

    spdlog::debug("Received handoff with {} argument(s) from {}", invocation->args.size(), invocation->cwd);
    deliver(std::move(*invocation));

    if (!write_all(client_fd, kAck)) {
        spdlog::debug("Secondary went away before the acknowledgement");
    }
}

void SingleInstance::deliver(LaunchInvocation invocation) {
    std::lock_guard lock(callback_mutex_);
    if (handoff_callback_) {
        handoff_callback_(invocation);
    } else {
        pending_.push_back(std::move(invocation));
    }
}

} // namespace statisfy
