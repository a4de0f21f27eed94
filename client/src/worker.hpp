#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "ipc.hpp"
#include "net/transport.hpp"
#include "transfer/fetch_protocol.hpp"
#include "transfer/shared_buffer.hpp"

// Body of a worker process: performs the range GETs its agent asks for and writes each
// body into the named shared buffer given with the request.
class worker {
public:
    worker(ipc channel, std::string url, transport_factory factory);
    ~worker();

    // Serves requests until a stop message arrives or the controller goes away.
    // Returns the process exit code.
    int run();

private:
    fetch_result handle_fetch_request(const fetch_request& request);
    shared_buffer& map_buffer(const std::string& name);

    ipc m_ipc;
    std::string m_url;
    transport_factory m_factory;
    std::unique_ptr<transport> m_transport;

    // Pool buffers are recycled, so each name is mapped once per process.
    std::map<std::string, std::unique_ptr<posix_shared_buffer>> m_buffers;
};
