#include "worker.hpp"

#include <exception>
#include <iostream>
#include <unistd.h>

#include "log.hpp"

worker::worker(ipc channel, std::string url, transport_factory factory)
    : m_ipc(std::move(channel)), m_url(std::move(url)), m_factory(std::move(factory)) {}

worker::~worker() = default;

int worker::run() {
    URLSTREAM_LOG(std::cout << "[Worker] Running (pid " << getpid() << ")" << std::endl);

    try {
        m_transport = m_factory();
    } catch (const std::exception& e) {
        std::cerr << "[Worker] Failed to set up transport: " << e.what() << std::endl;
        return 1;
    }

    // Main worker loop - serve fetch requests
    while (m_ipc.is_connected()) {
        auto message = m_ipc.receive_json();
        if (!message) {
            URLSTREAM_LOG(std::cout << "[Worker] Controller went away" << std::endl);
            break;
        }

        fetch_message_type type = fetch_message_type::stop;
        fetch_request request;
        try {
            type = message->at("type").get<fetch_message_type>();
            if (type == fetch_message_type::fetch)
                request = message->get<fetch_request>();
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[Worker] Malformed request: " << e.what() << std::endl;
            return 1;
        }

        if (type == fetch_message_type::stop) {
            URLSTREAM_LOG(std::cout << "[Worker] Received stop request" << std::endl);
            break;
        }
        if (type != fetch_message_type::fetch) {
            std::cerr << "[Worker] Received invalid request" << std::endl;
            continue;
        }

        URLSTREAM_LOG(std::cout << "[Worker] Received fetch request (part " << request.part_index
                                << ", attempt " << request.attempt << ")" << std::endl);
        fetch_result result = handle_fetch_request(request);
        if (!m_ipc.send_fetch_result(result)) {
            URLSTREAM_LOG(std::cout << "[Worker] Failed to report part " << request.part_index
                                    << std::endl);
            break;
        }
    }

    m_buffers.clear();
    m_transport.reset();
    return 0;
}

fetch_result worker::handle_fetch_request(const fetch_request& request) {
    try {
        shared_buffer& buffer = map_buffer(request.buffer_name);
        if (buffer.capacity() < request.length) {
            fetch_result result;
            result.part_index = request.part_index;
            result.status = fetch_status::fatal_error;
            result.message = "buffer " + request.buffer_name + " holds " +
                             std::to_string(buffer.capacity()) + " bytes, part needs " +
                             std::to_string(request.length);
            return result;
        }

        auto response =
            m_transport->get_range(m_url, request.offset, request.length, buffer.data());
        return classify_range_response(request, response);
    } catch (const std::exception& e) {
        fetch_result result;
        result.part_index = request.part_index;
        result.status = fetch_status::fatal_error;
        result.message = e.what();
        return result;
    }
}

shared_buffer& worker::map_buffer(const std::string& name) {
    auto it = m_buffers.find(name);
    if (it == m_buffers.end())
        it = m_buffers.emplace(name, posix_shared_buffer::open(name)).first;
    return *it->second;
}
