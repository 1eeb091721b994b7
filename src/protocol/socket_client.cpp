/**
 * @file socket_client.cpp
 * @brief SocketProtocolClient: TCP probe, SNMPv2c over UDP, SSH via OpenSSH.
 *
 * Every call opens its own descriptors and closes them before returning;
 * nothing is cached between calls.
 */

#include "protocol/socket_client.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fleetwatch {

namespace {

using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Owns a file descriptor and closes it on scope exit.
 */
class FdGuard {
public:
    explicit FdGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

bool to_sockaddr(const std::string& address, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return ::inet_pton(AF_INET, address.c_str(), &out.sin_addr) == 1;
}

int remaining_ms(SteadyClock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}  // anonymous namespace

SocketProtocolClient::SocketProtocolClient(std::string ssh_binary)
    : ssh_binary_(std::move(ssh_binary)) {}

int32_t SocketProtocolClient::next_request_id() noexcept {
    int32_t id = request_counter_.fetch_add(1);
    if (id <= 0) {
        request_counter_.store(1);
        id = request_counter_.fetch_add(1);
    }
    return id;
}

// ─────────────────────────────────────────────
// TCP Probe
// ─────────────────────────────────────────────

bool SocketProtocolClient::probe(const std::string& address, uint16_t port, Duration timeout) {
    sockaddr_in target{};
    if (!to_sockaddr(address, port, target)) return false;

    FdGuard fd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd.valid()) return false;

    int ret = ::connect(fd.get(), reinterpret_cast<const sockaddr*>(&target), sizeof(target));
    if (ret == 0) return true;
    if (errno != EINPROGRESS) return false;

    pollfd pfd{};
    pfd.fd = fd.get();
    pfd.events = POLLOUT;

    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready <= 0) return false;

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0) return false;
    return err == 0;
}

// ─────────────────────────────────────────────
// SNMP
// ─────────────────────────────────────────────

Result<snmp::Message> SocketProtocolClient::exchange(const std::string& address,
                                                     const std::vector<uint8_t>& request,
                                                     int32_t request_id,
                                                     Duration timeout) {
    sockaddr_in agent{};
    if (!to_sockaddr(address, SNMP_PORT, agent)) {
        return Error{ErrorCode::InvalidArgument, "Invalid address: " + address};
    }

    FdGuard fd(::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd.valid()) {
        return Error{ErrorCode::Transport, "Failed to create socket: " + std::string(strerror(errno))};
    }

    auto sent = ::sendto(fd.get(), request.data(), request.size(), 0,
                         reinterpret_cast<const sockaddr*>(&agent), sizeof(agent));
    if (sent != static_cast<ssize_t>(request.size())) {
        return Error{ErrorCode::Transport, "SNMP send failed: " + std::string(strerror(errno))};
    }

    auto deadline = SteadyClock::now() + timeout;
    std::vector<uint8_t> buffer(MAX_DATAGRAM);

    // Stray datagrams (late answers to earlier requests) are skipped until the deadline.
    while (true) {
        pollfd pfd{};
        pfd.fd = fd.get();
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready == 0) {
            return Error{ErrorCode::Transport, "SNMP request to " + address + " timed out"};
        }
        if (ready < 0) {
            if (errno == EINTR) continue;
            return Error{ErrorCode::Transport, "SNMP poll failed: " + std::string(strerror(errno))};
        }

        auto received = ::recv(fd.get(), buffer.data(), buffer.size(), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return Error{ErrorCode::Transport, "SNMP receive failed: " + std::string(strerror(errno))};
        }

        std::vector<uint8_t> datagram(buffer.begin(), buffer.begin() + received);
        auto message = snmp::decode_message(datagram);
        if (!message) continue;
        if (message->type != snmp::PduType::Response || message->request_id != request_id) continue;

        if (message->error_status != 0) {
            return Error{ErrorCode::Transport,
                         "SNMP agent " + address + " returned error-status "
                         + std::to_string(message->error_status)};
        }
        return message;
    }
}

Result<SnmpValue> SocketProtocolClient::snmp_get(const std::string& address,
                                                 const std::string& community,
                                                 const std::string& oid,
                                                 Duration timeout) {
    auto request_id = next_request_id();
    auto request = snmp::encode_request(snmp::PduType::Get, community, request_id, {oid});
    if (!request) return request.error();

    auto response = exchange(address, *request, request_id, timeout);
    if (!response) return response.error();

    if (response->bindings.empty()) {
        return Error{ErrorCode::Parse, "SNMP response without bindings"};
    }
    const auto& value = response->bindings.front().value;
    if (value.is_exception()) {
        return Error{ErrorCode::NotFound, "No such object " + oid + " on " + address};
    }
    return value;
}

Result<std::vector<SnmpBinding>> SocketProtocolClient::snmp_walk(const std::string& address,
                                                                 const std::string& community,
                                                                 const std::string& oid,
                                                                 Duration timeout) {
    std::vector<SnmpBinding> rows;
    std::string cursor = oid;

    while (rows.size() < MAX_WALK_ROWS) {
        auto request_id = next_request_id();
        auto request = snmp::encode_request(snmp::PduType::GetNext, community, request_id, {cursor});
        if (!request) return request.error();

        auto response = exchange(address, *request, request_id, timeout);
        if (!response) return response.error();
        if (response->bindings.empty()) break;

        auto& binding = response->bindings.front();
        if (binding.value.type == SnmpValue::Type::EndOfMibView) break;
        if (!oid_suffix(binding.oid, oid).has_value()) break;
        if (binding.oid == cursor) {
            return Error{ErrorCode::Parse, "SNMP agent " + address + " is not advancing the walk"};
        }

        cursor = binding.oid;
        rows.push_back(std::move(binding));
    }
    return rows;
}

// ─────────────────────────────────────────────
// SSH
// ─────────────────────────────────────────────

Result<std::string> SocketProtocolClient::ssh_exec(const std::string& address,
                                                   const Credentials& credentials,
                                                   const std::string& command,
                                                   Duration timeout) {
    // The whole batch is written into the stdin pipe before the child starts,
    // so it has to fit in the pipe buffer.
    constexpr size_t MAX_BATCH_BYTES = 60 * 1024;
    if (command.size() > MAX_BATCH_BYTES) {
        return Error{ErrorCode::InvalidArgument, "SSH command batch too large"};
    }

    // Close-on-exec: children forked by concurrent sessions must not hold our pipe ends.
    int in_pipe[2]{};
    int out_pipe[2]{};
    if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Transport, "pipe2() failed: " + std::string(strerror(errno))};
    }
    FdGuard in_read(in_pipe[0]);
    FdGuard in_write(in_pipe[1]);

    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Transport, "pipe2() failed: " + std::string(strerror(errno))};
    }
    FdGuard out_read(out_pipe[0]);
    FdGuard out_write(out_pipe[1]);

    std::string batch = command;
    if (!batch.empty() && batch.back() != '\n') batch += '\n';
    if (::write(in_write.get(), batch.data(), batch.size()) != static_cast<ssize_t>(batch.size())) {
        return Error{ErrorCode::Transport, "Failed to stage SSH command batch"};
    }
    in_write.reset();

    auto connect_timeout = std::to_string(std::max<int64_t>(1, timeout.count() / 1000));
    std::string target = credentials.ssh_user.empty() ? address : credentials.ssh_user + "@" + address;
    std::string connect_opt = "ConnectTimeout=" + connect_timeout;

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::Transport, "fork() failed: " + std::string(strerror(errno))};
    }

    if (pid == 0) {
        ::dup2(in_read.get(), STDIN_FILENO);
        ::dup2(out_write.get(), STDOUT_FILENO);
        ::dup2(out_write.get(), STDERR_FILENO);
        ::close(in_read.get());
        ::close(out_read.get());
        ::close(out_write.get());

        ::execlp(ssh_binary_.c_str(), ssh_binary_.c_str(),
                 "-T",
                 "-o", "BatchMode=yes",
                 "-o", "StrictHostKeyChecking=accept-new",
                 "-o", connect_opt.c_str(),
                 target.c_str(),
                 static_cast<char*>(nullptr));
        _exit(127);
    }

    in_read.reset();
    out_write.reset();

    std::string output;
    auto deadline = SteadyClock::now() + timeout;
    char chunk[4096];
    bool timed_out = false;

    while (true) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            timed_out = true;
            break;
        }

        pollfd pfd{};
        pfd.fd = out_read.get();
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) {
            timed_out = ready == 0;
            break;
        }

        auto n = ::read(out_read.get(), chunk, sizeof(chunk));
        if (n > 0) {
            output.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;  // EOF
    }

    if (timed_out) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (timed_out) {
        return Error{ErrorCode::Transport, "SSH session to " + address + " timed out"};
    }
    if (!WIFEXITED(status)) {
        return Error{ErrorCode::Transport, "SSH client terminated abnormally"};
    }
    if (WEXITSTATUS(status) != 0) {
        auto tail = output.size() > 256 ? output.substr(output.size() - 256) : output;
        return Error{ErrorCode::Transport, "SSH to " + address + " exited with status "
                                           + std::to_string(WEXITSTATUS(status)) + ": " + tail};
    }
    return output;
}

}  // namespace fleetwatch
