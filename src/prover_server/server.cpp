#include "server.hpp"

#include <iostream>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <string>

#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <signal.h>

namespace zkshard {
namespace prover_server {

namespace {

constexpr int LISTEN_BACKLOG = 16;

// Closes the descriptor unless released
struct FdGuard {
    int fd;
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    int release() { int out = fd; fd = -1; return out; }
};

// Socket, options, bind and listen for one address family; -1 on error
int open_listener(int family, const sockaddr* addr, socklen_t len, const std::string& where) {
    FdGuard guard{::socket(family, SOCK_STREAM, 0)};
    if (guard.fd < 0) {
        std::cerr << "[server] socket() for " << where << ": " << strerror(errno) << std::endl;
        return -1;
    }
    if (family == AF_INET) {
        int reuse = 1;
        if (::setsockopt(guard.fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            std::cerr << "[server] SO_REUSEADDR on " << where << ": " << strerror(errno) << std::endl;
            return -1;
        }
    }
    if (::bind(guard.fd, addr, len) < 0) {
        std::cerr << "[server] bind " << where << ": " << strerror(errno) << std::endl;
        return -1;
    }
    if (::listen(guard.fd, LISTEN_BACKLOG) < 0) {
        std::cerr << "[server] listen " << where << ": " << strerror(errno) << std::endl;
        return -1;
    }
    return guard.release();
}

std::string describe_peer(const sockaddr_storage& peer) {
    if (peer.ss_family != AF_INET) {
        return "local client";
    }
    const auto* in = reinterpret_cast<const sockaddr_in*>(&peer);
    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &in->sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(in->sin_port));
}

} // namespace

Server::Server() = default;

Server::~Server() {
    stop();
    if (!unix_socket_path_.empty()) {
        ::unlink(unix_socket_path_.c_str());
    }
}

void Server::set_request_handler(RequestHandler handler) {
    handler_ = std::move(handler);
}

bool Server::listen_tcp(const std::string& host, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        std::cerr << "[server] not an IPv4 address: " << host << std::endl;
        return false;
    }

    const std::string where = host + ":" + std::to_string(port);
    int fd = open_listener(AF_INET, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr), where);
    if (fd < 0) {
        return false;
    }
    server_fd_.store(fd);
    std::cout << "[server] Listening on " << where << std::endl;
    return true;
}

bool Server::listen_unix(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        std::cerr << "[server] socket path too long: " << path << std::endl;
        return false;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size());

    // A stale socket file from an earlier run blocks bind
    ::unlink(path.c_str());
    int fd = open_listener(AF_UNIX, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr), path);
    if (fd < 0) {
        return false;
    }
    server_fd_.store(fd);
    unix_socket_path_ = path;
    std::cout << "[server] Listening on " << path << std::endl;
    return true;
}

void Server::run() {
    int listen_fd = server_fd_.load();
    if (listen_fd < 0) {
        std::cerr << "[server] Not listening" << std::endl;
        return;
    }

    running_.store(true);

    // Ignore SIGPIPE (we handle write errors explicitly)
    signal(SIGPIPE, SIG_IGN);

    std::cout << "[server] Ready to accept connections" << std::endl;

    while (running_.load()) {
        struct sockaddr_storage client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = ::accept(listen_fd, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);

        if (client_fd < 0) {
            if (!running_.load()) {
                break;  // Server stopped
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EBADF || errno == EINVAL) {
                break;  // Listening socket closed or shut down
            }
            std::cerr << "[server] Accept failed: " << strerror(errno) << std::endl;
            continue;
        }

        std::cout << "[server] Connection from " << describe_peer(client_addr) << std::endl;

        reap_finished();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(connections_mutex_);
        client_fds_.insert(client_fd);
        connections_.push_back(Connection{
            std::thread([this, client_fd, done]() {
                handle_client(client_fd);
                {
                    std::lock_guard<std::mutex> fd_lock(connections_mutex_);
                    client_fds_.erase(client_fd);
                }
                ::close(client_fd);
                done->store(true);
            }),
            done});
    }

    running_.store(false);
}

void Server::request_stop() {
    running_.store(false);
    int fd = server_fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void Server::stop() {
    request_stop();

    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }

    std::vector<Connection> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        // Unblock clients still waiting on a read; in-flight proofs finish
        for (int client_fd : client_fds_) {
            ::shutdown(client_fd, SHUT_RD);
        }
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        if (connection.thread.joinable()) {
            connection.thread.join();
        }
    }
}

size_t Server::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    size_t active = 0;
    for (const auto& connection : connections_) {
        if (!connection.done->load()) {
            ++active;
        }
    }
    return active;
}

void Server::reap_finished() {
    std::vector<Connection> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : finished) {
        connection.thread.join();
    }
}

void Server::handle_client(int client_fd) {
    SocketReader reader(client_fd);
    SocketWriter writer(client_fd);

    auto request_opt = reader.read_request();
    if (!request_opt) {
        std::cerr << "[server] Failed to read request" << std::endl;
        return;
    }

    const NodeRequest& request = *request_opt;

    std::cout << "[server] Request received: job_id=" << request.job_id
              << " kind=" << (request.kind == RequestKind::Prove ? "prove" : "status") << std::endl;

    NodeResponse response;

    if (handler_) {
        auto start = std::chrono::high_resolution_clock::now();
        response = handler_(request);
        auto end = std::chrono::high_resolution_clock::now();
        double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

        if (response.status == ResponseStatus::Ok) {
            std::cout << "[server] job_id=" << response.job_id << " OK"
                      << " payload_size=" << response.payload.size()
                      << " duration_ms=" << duration_ms << std::endl;
        } else {
            std::cout << "[server] job_id=" << response.job_id << " " << to_string(response.status)
                      << " error=" << response.error_message << std::endl;
        }
    } else {
        std::cerr << "[server] No request handler set!" << std::endl;
        response = NodeResponse::error(request.job_id, "No request handler configured");
    }

    if (!writer.write_response(response)) {
        std::cerr << "[server] Failed to send response job_id=" << request.job_id << std::endl;
    }
}

} // namespace prover_server
} // namespace zkshard
