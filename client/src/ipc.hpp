#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

#include "transfer/fetch_protocol.hpp"

// One end of a connected AF_UNIX stream socket carrying length-prefixed JSON messages
// between the controller and a worker process.
class ipc {
public:
    ipc();
    explicit ipc(int socket_fd);
    ~ipc();

    ipc(const ipc&) = delete;
    ipc& operator=(const ipc&) = delete;

    ipc(ipc&& other) noexcept;
    ipc& operator=(ipc&& other) noexcept;

    // socketpair(); empty on failure.
    static std::optional<std::pair<ipc, ipc>> create_pair();

    // Message passing
    bool send_message(const std::string& message);
    std::optional<std::string> receive_message();
    bool send_json(const nlohmann::json& message);
    std::optional<nlohmann::json> receive_json();

    // Controller side
    bool send_fetch_request(const fetch_request& request);
    bool send_stop();
    std::optional<fetch_result> receive_fetch_result();

    // Worker side
    bool send_fetch_result(const fetch_result& result);

    // Ends both directions; a thread blocked in receive returns empty. The descriptor
    // stays open until close_socket().
    void shutdown();
    void close_socket();

    // Common operations
    bool is_connected() const;
    int get_socket_fd() const;

private:
    bool send_all(const void* data, std::size_t length);
    bool receive_all(void* data, std::size_t length);

    int m_socket_fd = -1;
};
