#include <gtest/gtest.h>

#include <vector>

#include "transfer/assembler.hpp"

namespace {
completion_record record_for(std::size_t index, std::uint8_t fill = 0) {
    completion_record record;
    record.index = index;
    record.offset = index * 4;
    record.length = 4;
    record.buffer = buffer_lease::detached(std::vector<std::uint8_t>(4, fill));
    record.attempts = 1;
    return record;
}

std::vector<std::size_t> drain(assembler& a) {
    std::vector<std::size_t> out;
    while (auto ready = a.next_ready())
        out.push_back(ready->index);
    return out;
}
} // namespace

TEST(Assembler, InOrderRecordsPassStraightThrough) {
    assembler a(3);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_TRUE(a.accept(record_for(i)));
        auto ready = a.next_ready();
        ASSERT_TRUE(ready.has_value());
        EXPECT_EQ(ready->index, i);
    }
    EXPECT_TRUE(a.exhausted());
}

TEST(Assembler, HoldsEarlyRecordsUntilTheGapCloses) {
    assembler a(5);
    a.accept(record_for(4));
    a.accept(record_for(2));
    a.accept(record_for(1));
    EXPECT_FALSE(a.next_ready().has_value());
    EXPECT_EQ(a.held(), 3u);

    a.accept(record_for(0));
    EXPECT_EQ(drain(a), (std::vector<std::size_t>{0, 1, 2}));
    EXPECT_EQ(a.next_required_index(), 3u);
    EXPECT_EQ(a.held(), 1u);

    a.accept(record_for(3));
    EXPECT_EQ(drain(a), (std::vector<std::size_t>{3, 4}));
    EXPECT_TRUE(a.exhausted());
}

TEST(Assembler, DuplicatesAndStaleRecordsAreDiscarded) {
    assembler a(3);
    EXPECT_TRUE(a.accept(record_for(1)));
    EXPECT_FALSE(a.accept(record_for(1)));
    EXPECT_TRUE(a.accept(record_for(0)));
    EXPECT_EQ(drain(a), (std::vector<std::size_t>{0, 1}));

    EXPECT_FALSE(a.accept(record_for(0)));
    EXPECT_FALSE(a.accept(record_for(7)));
    EXPECT_EQ(a.delivered(), 2u);
}

TEST(Assembler, UnorderedModeYieldsCompletionOrder) {
    assembler a(3, delivery_order::unordered);
    a.accept(record_for(2));
    a.accept(record_for(0));
    a.accept(record_for(1));
    EXPECT_EQ(drain(a), (std::vector<std::size_t>{2, 0, 1}));
    EXPECT_TRUE(a.exhausted());
}

TEST(Assembler, EmptyObjectIsImmediatelyExhausted) {
    assembler a(0);
    EXPECT_TRUE(a.exhausted());
    EXPECT_FALSE(a.next_ready().has_value());
}
