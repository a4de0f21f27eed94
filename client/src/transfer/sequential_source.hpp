#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include "net/transport.hpp"
#include "transfer/part_source.hpp"
#include "transfer/part_table.hpp"

// Fetch path for disabled concurrency: one streaming GET for the whole object, cut into
// the planned parts in order on the caller's thread. Nothing is retried.
class sequential_source : public part_source {
public:
    sequential_source(std::unique_ptr<body_reader> body, part_table& parts);

    std::optional<completion_record> next_completion() override;
    void cancel() override;
    void shutdown() override;

private:
    completion_record failure(std::size_t index, const std::string& message, int http_status);

    std::unique_ptr<body_reader> m_body;
    part_table& m_parts;
    std::atomic<bool> m_cancelled;
    bool m_done;
};
