#include "ipc.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <sys/socket.h>
#include <unistd.h>

#include "log.hpp"

namespace {
// Largest frame either side will accept.
constexpr std::size_t max_message_length = 1 << 20;
} // namespace

ipc::ipc() = default;

ipc::ipc(int socket_fd) : m_socket_fd(socket_fd) {}

ipc::~ipc() {
    close_socket();
}

ipc::ipc(ipc&& other) noexcept : m_socket_fd(other.m_socket_fd) {
    other.m_socket_fd = -1;
}

ipc& ipc::operator=(ipc&& other) noexcept {
    if (this != &other) {
        close_socket();
        m_socket_fd = other.m_socket_fd;
        other.m_socket_fd = -1;
    }
    return *this;
}

std::optional<std::pair<ipc, ipc>> ipc::create_pair() {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1) {
        std::cerr << "[IPC] Failed to create socket pair: " << strerror(errno) << std::endl;
        return std::nullopt;
    }
    return std::make_pair(ipc(fds[0]), ipc(fds[1]));
}

bool ipc::send_all(const void* data, std::size_t length) {
    const char* cursor = static_cast<const char*>(data);
    while (length > 0) {
        ssize_t sent = send(m_socket_fd, cursor, length, MSG_NOSIGNAL);
        if (sent == -1) {
            if (errno == EINTR)
                continue;
            return false;
        }
        cursor += sent;
        length -= static_cast<std::size_t>(sent);
    }
    return true;
}

bool ipc::receive_all(void* data, std::size_t length) {
    char* cursor = static_cast<char*>(data);
    while (length > 0) {
        ssize_t received = recv(m_socket_fd, cursor, length, 0);
        if (received == -1) {
            if (errno == EINTR)
                continue;
            return false;
        }
        if (received == 0) // peer closed
            return false;
        cursor += received;
        length -= static_cast<std::size_t>(received);
    }
    return true;
}

bool ipc::send_message(const std::string& message) {
    if (m_socket_fd == -1) {
        std::cerr << "[IPC] Socket not connected" << std::endl;
        return false;
    }

    // Send message length first
    std::size_t length = message.length();
    if (!send_all(&length, sizeof(length))) {
        URLSTREAM_LOG(std::cerr << "[IPC] Failed to send message length: " << strerror(errno)
                                << " (errno: " << errno << ")" << std::endl);
        return false;
    }

    // Send message content
    if (!send_all(message.data(), length)) {
        URLSTREAM_LOG(std::cerr << "[IPC] Failed to send message content: " << strerror(errno)
                                << " (errno: " << errno << ")" << std::endl);
        return false;
    }

    URLSTREAM_LOG(std::cout << "[IPC] Message sent: " << message << std::endl);
    return true;
}

std::optional<std::string> ipc::receive_message() {
    if (m_socket_fd == -1) {
        std::cerr << "[IPC] Socket not connected" << std::endl;
        return std::nullopt;
    }

    // Receive message length first
    std::size_t length = 0;
    if (!receive_all(&length, sizeof(length)))
        return std::nullopt;

    if (length > max_message_length) {
        std::cerr << "[IPC] Refusing message of " << length << " bytes" << std::endl;
        return std::nullopt;
    }

    // Receive message content
    std::string message(length, '\0');
    if (length > 0 && !receive_all(&message[0], length)) {
        std::cerr << "[IPC] Connection lost in the middle of a message" << std::endl;
        return std::nullopt;
    }

    URLSTREAM_LOG(std::cout << "[IPC] Message received: " << message << std::endl);
    return message;
}

bool ipc::send_json(const nlohmann::json& message) {
    return send_message(message.dump());
}

std::optional<nlohmann::json> ipc::receive_json() {
    auto message = receive_message();
    if (!message)
        return std::nullopt;

    try {
        auto parsed = nlohmann::json::parse(*message);
        if (!parsed.is_object() || !parsed.contains("type")) {
            std::cerr << "[IPC] Message without a type: " << *message << std::endl;
            return std::nullopt;
        }
        return parsed;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[IPC] Failed to parse message JSON: " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool ipc::send_fetch_request(const fetch_request& request) {
    return send_json(request);
}

bool ipc::send_stop() {
    return send_json(nlohmann::json{{"type", fetch_message_type::stop}});
}

std::optional<fetch_result> ipc::receive_fetch_result() {
    auto message = receive_json();
    if (!message)
        return std::nullopt;

    try {
        if (message->at("type").get<fetch_message_type>() != fetch_message_type::result) {
            std::cerr << "[IPC] Expected a result message, got: " << message->dump()
                      << std::endl;
            return std::nullopt;
        }
        return message->get<fetch_result>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[IPC] Malformed result message: " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool ipc::send_fetch_result(const fetch_result& result) {
    return send_json(result);
}

void ipc::shutdown() {
    if (m_socket_fd != -1)
        ::shutdown(m_socket_fd, SHUT_RDWR);
}

void ipc::close_socket() {
    if (m_socket_fd != -1) {
        close(m_socket_fd);
        m_socket_fd = -1;
    }
}

bool ipc::is_connected() const {
    return m_socket_fd != -1;
}

int ipc::get_socket_fd() const {
    return m_socket_fd;
}
