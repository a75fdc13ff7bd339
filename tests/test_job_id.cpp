#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <thread>
#include <vector>

#include "scheduler/job_id.hpp"

TEST(JobIdTest, GeneratedIdHasUlidShape) {
    auto id = JobId::generate();
    ASSERT_EQ(id.str().size(), JobId::kLength);
    EXPECT_FALSE(id.empty());
    EXPECT_LE(id.str()[0], '7');
    EXPECT_EQ(id.str().find_first_not_of("0123456789ABCDEFGHJKMNPQRSTVWXYZ"), std::string::npos);
}

TEST(JobIdTest, DefaultIdIsEmpty) {
    JobId id;
    EXPECT_TRUE(id.empty());
}

TEST(JobIdTest, IdsAreStrictlyIncreasingInOneThread) {
    std::vector<JobId> ids;
    for (int i = 0; i < 1000; ++i) ids.push_back(JobId::generate());
    for (std::size_t i = 1; i < ids.size(); ++i) {
        EXPECT_LT(ids[i - 1], ids[i]);
        EXPECT_LT(ids[i - 1].str(), ids[i].str());
    }
}

TEST(JobIdTest, IdsAreUniqueAcrossThreads) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::vector<JobId>> perThread(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&perThread, t] {
            for (int i = 0; i < kPerThread; ++i) perThread[t].push_back(JobId::generate());
        });
    }
    for (auto& th : threads) th.join();

    std::set<std::string> all;
    for (const auto& v : perThread) {
        for (const auto& id : v) all.insert(id.str());
    }
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(JobIdTest, TimestampMatchesGenerationTime) {
    auto before = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    auto id = JobId::generate();
    auto after = std::chrono::system_clock::now();
    EXPECT_GE(id.timestamp(), before);
    EXPECT_LE(id.timestamp(), after);
}

TEST(JobIdTest, ParseAcceptsLowercaseAndNormalizes) {
    auto id = JobId::generate();
    std::string lower = id.str();
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto parsed = JobId::parse(lower);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST(JobIdTest, ParseRejectsMalformedText) {
    EXPECT_FALSE(JobId::parse("").has_value());
    EXPECT_FALSE(JobId::parse("01ARZ3NDEKTSV4RRFFQ69G5FA").has_value());     // 25 位
    EXPECT_FALSE(JobId::parse("01ARZ3NDEKTSV4RRFFQ69G5FAVX").has_value());   // 27 位
    EXPECT_FALSE(JobId::parse("01ARZ3NDEKTSV4RRFFQ69G5FAU").has_value());    // U 不在字母表
    EXPECT_FALSE(JobId::parse("81ARZ3NDEKTSV4RRFFQ69G5FAV").has_value());    // 超出 128 位
    EXPECT_TRUE(JobId::parse("01ARZ3NDEKTSV4RRFFQ69G5FAV").has_value());
}

TEST(JobIdTest, HashableInUnorderedContainers) {
    auto a = JobId::generate();
    auto b = *JobId::parse(a.str());
    EXPECT_EQ(std::hash<JobId>{}(a), std::hash<JobId>{}(b));
}
