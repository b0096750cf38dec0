#include <atomic>
#include <mutex>
#include <thread>
#include "gtest/gtest.h"
#include "judge/registry.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace arbiter;
using arbiter::test::make_submission;

TEST(RegistryTest, AdmitAndRelease) {
    submission_registry registry;
    rejection_reason reason;
    {
        auto registration = registry.admit(make_submission("1", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 3, reason);
        ASSERT_TRUE(registration);
        EXPECT_EQ(reason, rejection_reason::NONE);
        EXPECT_EQ(registry.size(), 1u);

        auto progress = registry.lookup("1");
        ASSERT_TRUE(progress);
        EXPECT_EQ(progress->submitter, "alice");
        EXPECT_EQ(progress->state, submission_state::QUEUED);
        EXPECT_EQ(progress->completed, 0u);
        EXPECT_EQ(progress->total, 3u);
    }
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.lookup("1"));
}

TEST(RegistryTest, RejectsDuplicateId) {
    submission_registry registry;
    rejection_reason reason;
    auto first = registry.admit(make_submission("1", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);
    ASSERT_TRUE(first);

    auto second = registry.admit(make_submission("1", "bob", 1, "sh", ""), admission_kind::SUBMISSION, 1, reason);
    EXPECT_FALSE(second);
    EXPECT_EQ(reason, rejection_reason::DUPLICATE_ID);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(RegistryTest, OneInFlightPerSubmitterAndProblem) {
    submission_registry registry;
    rejection_reason reason;
    auto first = registry.admit(make_submission("1", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);
    ASSERT_TRUE(first);

    EXPECT_FALSE(registry.admit(make_submission("2", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason));
    EXPECT_EQ(reason, rejection_reason::ALREADY_IN_FLIGHT);

    // 不同题目、不同选手、测试运行使用不同的键
    auto other_problem = registry.admit(make_submission("3", "alice", 1, "sh", ""), admission_kind::SUBMISSION, 1, reason);
    auto other_user = registry.admit(make_submission("4", "bob", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);
    auto test_run = registry.admit(make_submission("5", "alice", 0, "sh", ""), admission_kind::TEST_RUN, 1, reason);
    EXPECT_TRUE(other_problem);
    EXPECT_TRUE(other_user);
    EXPECT_TRUE(test_run);
    EXPECT_EQ(registry.size(), 4u);

    first.release();
    EXPECT_TRUE(registry.admit(make_submission("6", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason));
}

TEST(RegistryTest, ReleaseIsIdempotent) {
    submission_registry registry;
    rejection_reason reason;
    auto registration = registry.admit(make_submission("1", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);
    registration.release();
    registration.release();
    EXPECT_FALSE(registration);
    EXPECT_EQ(registry.size(), 0u);

    // 重新插入同一个 id 后，旧的 registration 不能移除新的表项
    auto again = registry.admit(make_submission("1", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);
    registration.release();
    EXPECT_EQ(registry.size(), 1u);
}

TEST(RegistryTest, MoveTransfersOwnership) {
    submission_registry registry;
    rejection_reason reason;
    submission_registry::registration outer;
    {
        auto inner = registry.admit(make_submission("1", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);
        outer = move(inner);
    }
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(outer.entry().id, "1");
    outer = submission_registry::registration();
    EXPECT_EQ(registry.size(), 0u);
}

TEST(RegistryTest, ProgressIsVisible) {
    submission_registry registry;
    rejection_reason reason;
    auto registration = registry.admit(make_submission("1", "alice", 0, "sh", ""), admission_kind::TEST_RUN, 2, reason);
    registration.entry().state = submission_state::RUNNING;
    ++registration.entry().completed;

    auto list = registry.list();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].kind, admission_kind::TEST_RUN);
    EXPECT_EQ(list[0].state, submission_state::RUNNING);
    EXPECT_EQ(list[0].completed, 1u);
}

TEST(RegistryTest, Cancellation) {
    submission_registry registry;
    rejection_reason reason;
    auto a = registry.admit(make_submission("a", "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);
    auto b = registry.admit(make_submission("b", "bob", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);

    EXPECT_FALSE(registry.cancel("missing"));
    EXPECT_TRUE(registry.cancel("a"));
    EXPECT_TRUE(a.entry().cancel.is_cancelled());
    EXPECT_FALSE(b.entry().cancel.is_cancelled());

    registry.cancel_all();
    EXPECT_TRUE(b.entry().cancel.is_cancelled());
}

TEST(RegistryTest, ConcurrentAdmissionAdmitsExactlyOne) {
    submission_registry registry;
    const int threads = 16;
    atomic<int> admitted{0}, in_flight{0};
    mutex mut;
    vector<submission_registry::registration> held;

    vector<thread> workers;
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&, i] {
            rejection_reason reason;
            auto registration = registry.admit(make_submission(to_string(i), "alice", 0, "sh", ""), admission_kind::SUBMISSION, 1, reason);
            if (registration) {
                ++admitted;
                scoped_lock lock(mut);
                held.push_back(move(registration));
            } else if (reason == rejection_reason::ALREADY_IN_FLIGHT) {
                ++in_flight;
            }
        });
    }
    for (auto &worker : workers) worker.join();

    EXPECT_EQ(admitted.load(), 1);
    EXPECT_EQ(in_flight.load(), threads - 1);
    EXPECT_EQ(registry.size(), 1u);
}
