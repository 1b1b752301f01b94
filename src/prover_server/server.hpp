#pragma once

/**
 * zkshard request-intake server
 *
 * Socket server that receives proof requests and returns final proofs.
 * Each client connection is served on its own thread, so concurrent
 * requests compete only for device slots.
 *
 * Usage:
 *   ./zkshard_node prove ... --tcp 127.0.0.1:5555
 *   ./zkshard_node prove ... --unix /tmp/zkshard.sock
 */

#include <string>
#include <functional>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "protocol.hpp"

namespace zkshard {
namespace prover_server {

// Callback type for handling requests
using RequestHandler = std::function<NodeResponse(const NodeRequest&)>;

class Server {
public:
    Server();
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    void set_request_handler(RequestHandler handler);

    // Start listening on TCP
    bool listen_tcp(const std::string& host, uint16_t port);

    // Start listening on Unix socket
    bool listen_unix(const std::string& path);

    // Run the accept loop (blocks until stop() or request_stop())
    void run();

    // Close the listening socket only. Safe from a signal handler.
    void request_stop();

    // Close the listening socket, unblock idle clients and join every
    // connection thread
    void stop();

    bool is_running() const { return running_.load(); }

    size_t active_connections() const;

private:
    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void handle_client(int client_fd);
    void reap_finished();

    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};
    RequestHandler handler_;
    std::string unix_socket_path_;  // For cleanup

    mutable std::mutex connections_mutex_;
    std::vector<Connection> connections_;
    std::set<int> client_fds_;
};

} // namespace prover_server
} // namespace zkshard
