#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

#include "ipc.hpp"
#include "transfer/shared_buffer.hpp"
#include "worker.hpp"
#include "support/memory_transport.hpp"

using test_support::memory_factory;
using test_support::memory_server;

TEST(Ipc, FramesArriveWhole) {
    auto pair = ipc::create_pair();
    ASSERT_TRUE(pair.has_value());

    std::string large(200000, 'x');
    std::thread writer([&] {
        EXPECT_TRUE(pair->first.send_message("short"));
        EXPECT_TRUE(pair->first.send_message(large));
        EXPECT_TRUE(pair->first.send_message(""));
    });

    auto first = pair->second.receive_message();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "short");
    auto second = pair->second.receive_message();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->size(), large.size());
    auto third = pair->second.receive_message();
    ASSERT_TRUE(third.has_value());
    EXPECT_TRUE(third->empty());
    writer.join();
}

TEST(Ipc, ClosedPeerEndsReceive) {
    auto pair = ipc::create_pair();
    ASSERT_TRUE(pair.has_value());
    pair->first.close_socket();
    EXPECT_FALSE(pair->second.receive_message().has_value());
    EXPECT_FALSE(pair->second.send_message("nobody listens"));
}

TEST(Ipc, ShutdownUnblocksReceiver) {
    auto pair = ipc::create_pair();
    ASSERT_TRUE(pair.has_value());

    std::thread reader([&] { EXPECT_FALSE(pair->second.receive_fetch_result().has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pair->second.shutdown();
    reader.join();
}

TEST(Ipc, RejectsMessagesWithoutType) {
    auto pair = ipc::create_pair();
    ASSERT_TRUE(pair.has_value());
    ASSERT_TRUE(pair->first.send_message(R"({"part": 1})"));
    ASSERT_TRUE(pair->first.send_message("not json"));
    EXPECT_FALSE(pair->second.receive_json().has_value());
    EXPECT_FALSE(pair->second.receive_json().has_value());
}

TEST(Worker, FillsNamedBufferInChildProcess) {
    auto server = memory_server::make(10000);
    const std::string name = "/urlstream-worker-test-" + std::to_string(getpid());
    auto buffer = posix_shared_buffer::create(name, 4096);

    auto pair = ipc::create_pair();
    ASSERT_TRUE(pair.has_value());

    pid_t pid = fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        pair->first.close_socket();
        worker w(std::move(pair->second), "http://example.test/object", memory_factory(server));
        _exit(w.run());
    }
    pair->second.close_socket();

    fetch_request request;
    request.part_index = 1;
    request.offset = 4096;
    request.length = 4096;
    request.attempt = 1;
    request.buffer_name = name;
    ASSERT_TRUE(pair->first.send_fetch_request(request));

    auto result = pair->first.receive_fetch_result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, fetch_status::completed);
    EXPECT_EQ(result->part_index, 1u);
    EXPECT_EQ(result->http_status, 206);
    EXPECT_EQ(std::memcmp(buffer->data(), server->bytes.data() + 4096, 4096), 0);

    // A part larger than its buffer is refused
    request.length = 8192;
    ASSERT_TRUE(pair->first.send_fetch_request(request));
    result = pair->first.receive_fetch_result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, fetch_status::fatal_error);

    ASSERT_TRUE(pair->first.send_stop());
    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
