#pragma once

#include <optional>

#include "transfer/completion.hpp"

// Producer side of a download session.
class part_source {
public:
    virtual ~part_source() = default;

    // Blocks for the next completion in whatever order parts finish. Empty once the
    // source has nothing more to deliver (every part published, or cancelled).
    virtual std::optional<completion_record> next_completion() = 0;

    // Stops producing and wakes a blocked next_completion(). Safe from any thread,
    // more than once.
    virtual void cancel() = 0;

    // Waits for producers to exit. Records still queued stay retrievable.
    virtual void shutdown() = 0;
};
