#include "core/IdGenerator.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <set>

using namespace courier::core;

TEST(IdGeneratorTest, RandomIdsAreVersion4Uuids) {
    RandomIdGenerator ids;
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = ids.nextId();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(IdGeneratorTest, SeededGeneratorRepeats) {
    RandomIdGenerator a(99);
    RandomIdGenerator b(99);
    EXPECT_EQ(a.nextId(), b.nextId());
    EXPECT_EQ(a.nextId(), b.nextId());
}

TEST(IdGeneratorTest, SequentialIdsCountUp) {
    SequentialIdGenerator ids("job-");
    EXPECT_EQ(ids.nextId(), "job-1");
    EXPECT_EQ(ids.nextId(), "job-2");
}
