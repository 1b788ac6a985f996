#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>
#include "shmkv/errors.hpp"
#include "shmkv/kvstore.hpp"
#include "shmkv/segment.hpp"
#include "test_helpers.hpp"

using namespace shmkv;

namespace {

// Runs body in a forked child and returns its exit status.
// Children never touch gtest state; they report through the exit code.
template <typename Body>
pid_t Spawn(Body body) {
    pid_t pid = ::fork();
    if (pid == 0) {
        int code = body();
        ::_exit(code);
    }
    return pid;
}

int Wait(pid_t pid) {
    int status = 0;
    if (::waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

} // namespace

TEST(MultiProcessTest, ChildWritesAreVisibleToParent) {
    const std::string name = test::UniqueSegmentName();
    test::SegmentCleanup cleanup(name);

    Segment segment;
    ASSERT_FALSE(Segment::Create(name, segment));
    KvStore kv(segment);

    pid_t child = Spawn([&name] {
        Segment mine;
        if (Segment::Open(name, mine)) {
            return 10;
        }
        KvStore store(mine);
        if (store.Put("from-child", "hello")) {
            return 11;
        }
        return 0;
    });
    ASSERT_GT(child, 0);
    ASSERT_EQ(Wait(child), 0);

    Entry entry;
    ASSERT_FALSE(kv.Get("from-child", entry));
    EXPECT_EQ(entry.value, "hello");

    StatusSnapshot snapshot;
    ASSERT_FALSE(kv.Status(snapshot));
    EXPECT_EQ(snapshot.version, 2u);
    EXPECT_EQ(snapshot.entry_count, 1u);
}

TEST(MultiProcessTest, ChildCannotOpenAfterUnlink) {
    const std::string name = test::UniqueSegmentName();
    test::SegmentCleanup cleanup(name);

    Segment segment;
    ASSERT_FALSE(Segment::Create(name, segment));
    ASSERT_FALSE(Segment::Unlink(name));

    pid_t child = Spawn([&name] {
        Segment mine;
        return Segment::Open(name, mine) == Errc::NotFound ? 0 : 1;
    });
    ASSERT_GT(child, 0);
    EXPECT_EQ(Wait(child), 0);
}

TEST(MultiProcessTest, ConcurrentWritersKeepCountersConsistent) {
    const std::string name = test::UniqueSegmentName();
    test::SegmentCleanup cleanup(name);

    Segment segment;
    ASSERT_FALSE(Segment::Create(name, segment));

    const int writers = 4;
    const int rounds = 500;
    std::vector<pid_t> children;
    for (int w = 0; w < writers; ++w) {
        children.push_back(Spawn([&name, w, rounds] {
            Segment mine;
            if (Segment::Open(name, mine)) {
                return 10;
            }
            KvStore store(mine);
            const std::string key = "writer" + std::to_string(w);
            for (int i = 0; i < rounds; ++i) {
                if (store.Put(key, std::to_string(i))) {
                    return 11;
                }
                if (store.Delete(key)) {
                    return 12;
                }
            }
            if (store.Put(key, "done")) {
                return 13;
            }
            return 0;
        }));
    }
    for (pid_t child : children) {
        ASSERT_GT(child, 0);
        EXPECT_EQ(Wait(child), 0);
    }

    KvStore kv(segment);
    StatusSnapshot snapshot;
    ASSERT_FALSE(kv.Status(snapshot));
    EXPECT_EQ(snapshot.entry_count, static_cast<std::uint32_t>(writers));
    EXPECT_EQ(snapshot.entries.size(), static_cast<std::size_t>(writers));
    // Version starts at 1; each writer made 2 * rounds + 1 mutations.
    EXPECT_EQ(snapshot.version, 1u + static_cast<std::uint32_t>(writers * (2 * rounds + 1)));
    for (const auto& entry : snapshot.entries) {
        EXPECT_EQ(entry.value, "done");
    }
}

TEST(MultiProcessTest, ReadersNeverObservePartialWrites) {
    const std::string name = test::UniqueSegmentName();
    test::SegmentCleanup cleanup(name);

    Segment segment;
    ASSERT_FALSE(Segment::Create(name, segment));
    KvStore kv(segment);
    const std::string a(VALUE_SIZE - 1, 'a');
    const std::string b(VALUE_SIZE - 1, 'b');
    ASSERT_FALSE(kv.Put("flip", a));

    pid_t writer = Spawn([&name, &a, &b] {
        Segment mine;
        if (Segment::Open(name, mine)) {
            return 10;
        }
        KvStore store(mine);
        for (int i = 0; i < 2000; ++i) {
            if (store.Put("flip", (i % 2) ? a : b)) {
                return 11;
            }
            if (store.Put("extra", std::to_string(i))) {
                return 12;
            }
            if (store.Delete("extra")) {
                return 13;
            }
        }
        return 0;
    });
    ASSERT_GT(writer, 0);

    int torn = 0;
    int inconsistent = 0;
    for (int i = 0; i < 2000; ++i) {
        Entry entry;
        if (!kv.Get("flip", entry) && entry.value != a && entry.value != b) {
            ++torn;
        }
        StatusSnapshot snapshot;
        if (!kv.Status(snapshot) && snapshot.entry_count != snapshot.entries.size()) {
            ++inconsistent;
        }
    }
    EXPECT_EQ(Wait(writer), 0);
    EXPECT_EQ(torn, 0);
    EXPECT_EQ(inconsistent, 0);
}

TEST(MultiProcessTest, ThreadsSharingOneMapping) {
    const std::string name = test::UniqueSegmentName();
    test::SegmentCleanup cleanup(name);

    Segment segment;
    ASSERT_FALSE(Segment::Create(name, segment));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&segment, t] {
            KvStore store(segment);
            const std::string key = "thread" + std::to_string(t);
            for (int i = 0; i < 1000; ++i) {
                EXPECT_FALSE(store.Put(key, std::to_string(i)));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    KvStore kv(segment);
    StatusSnapshot snapshot;
    ASSERT_FALSE(kv.Status(snapshot));
    EXPECT_EQ(snapshot.entry_count, 4u);
    EXPECT_EQ(snapshot.version, 1u + 4u * 1000u);
    for (const auto& entry : snapshot.entries) {
        EXPECT_EQ(entry.value, "999");
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
