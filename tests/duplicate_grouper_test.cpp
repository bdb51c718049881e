#include <gtest/gtest.h>

#include "core/pipeline/duplicate_grouper.hpp"

using hashdup::core::DuplicateGrouper;
using hashdup::core::HashedFile;

namespace {

HashedFile hashed(std::string path, std::string hash, std::uint64_t size = 3) {
    return HashedFile{
        .path = path,
        .name = path,
        .size = size,
        .mime_type = "image/jpeg",
        .hash = std::move(hash)
    };
}

} // namespace

TEST(DuplicateGrouperTest, EmptyGrouperHasNoGroups)
{
    DuplicateGrouper grouper;
    EXPECT_TRUE(grouper.finalize().empty());
    EXPECT_EQ(grouper.unique_count(), 0u);
}

TEST(DuplicateGrouperTest, SingletonsAreDropped)
{
    DuplicateGrouper grouper;
    grouper.add(hashed("a", "h1"));
    grouper.add(hashed("b", "h2"));

    EXPECT_TRUE(grouper.finalize().empty());
    EXPECT_EQ(grouper.unique_count(), 2u);
    EXPECT_EQ(grouper.file_count(), 2u);
}

TEST(DuplicateGrouperTest, GroupsKeepFirstSeenOrder)
{
    DuplicateGrouper grouper;
    grouper.add(hashed("a", "h1"));
    grouper.add(hashed("b", "h2"));
    grouper.add(hashed("c", "h3"));
    grouper.add(hashed("d", "h2"));
    grouper.add(hashed("e", "h1"));
    grouper.add(hashed("f", "h2"));

    auto groups = grouper.finalize();
    ASSERT_EQ(groups.size(), 2u);

    EXPECT_EQ(groups[0].id, "group-0");
    EXPECT_EQ(groups[0].hash, "h1");
    ASSERT_EQ(groups[0].files.size(), 2u);
    EXPECT_EQ(groups[0].files[0].path, "a");
    EXPECT_EQ(groups[0].files[1].path, "e");

    EXPECT_EQ(groups[1].id, "group-1");
    EXPECT_EQ(groups[1].hash, "h2");
    ASSERT_EQ(groups[1].files.size(), 3u);
    EXPECT_EQ(groups[1].files[0].path, "b");
    EXPECT_EQ(groups[1].files[1].path, "d");
    EXPECT_EQ(groups[1].files[2].path, "f");

    EXPECT_EQ(grouper.unique_count(), 1u);
}

TEST(DuplicateGrouperTest, IdsSkipSingletonHashes)
{
    DuplicateGrouper grouper;
    grouper.add(hashed("solo", "h0"));
    grouper.add(hashed("a", "h1"));
    grouper.add(hashed("b", "h1"));

    auto groups = grouper.finalize();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].id, "group-0");
}

TEST(DuplicateGrouperTest, GroupSizeComesFromFirstMember)
{
    DuplicateGrouper grouper;
    grouper.add(hashed("a", "h", 1024));
    grouper.add(hashed("b", "h", 1024));

    auto groups = grouper.finalize();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].size, 1024u);
}

TEST(DuplicateGrouperTest, SummaryCountsRedundantCopies)
{
    DuplicateGrouper grouper;
    for (const char* path : {"a", "b", "c"}) grouper.add(hashed(path, "big", 100));
    for (const char* path : {"d", "e"}) grouper.add(hashed(path, "small", 10));
    grouper.add(hashed("f", "unique", 5));

    auto summary = hashdup::core::summarize(grouper.finalize());
    EXPECT_EQ(summary.group_count, 2u);
    EXPECT_EQ(summary.duplicate_file_count, 3u);
    EXPECT_EQ(summary.wasted_bytes, 2u * 100u + 10u);
}
