#include <atomic>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/process_sandbox.hpp"
#include "server/event_dispatcher.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::server;
using namespace nlohmann;

static announcement make_announcement(const string &message) {
    return announcement{"judges", message, chrono::system_clock::now()};
}

TEST(EventsTest, KindNames) {
    auto now = chrono::system_clock::now();
    EXPECT_STREQ(event_kind(submission_queued{"1", "alice", 0, now}), "submission_queued");
    EXPECT_STREQ(event_kind(test_evaluation{"alice", 0, "A", 1, 0, 100, now}), "test_evaluation");
    EXPECT_STREQ(event_kind(paused{"judges", now}), "paused");
    EXPECT_STREQ(event_kind(unpaused{"judges", now}), "unpaused");
    EXPECT_STREQ(event_kind(check_in{"alice", now}), "check_in");
    EXPECT_STREQ(event_kind(score_update{"alice", 0, {}, now}), "score_update");
}

TEST(EventsTest, FormatTime) {
    EXPECT_EQ(format_time(event_time()), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_time(event_time(chrono::seconds(1700000000))), "2023-11-14T22:13:20Z");
}

TEST(EventsTest, Serialization) {
    event_time time(chrono::seconds(0));
    json j = server_event(submission_finalized{"42", "alice", 1, "Reverse", submission_state::COMPLETED, 2, 1, 50.0, false, time});
    EXPECT_EQ(j.at("kind"), "submission_finalized");
    EXPECT_EQ(j.at("submission_id"), "42");
    EXPECT_EQ(j.at("submitter"), "alice");
    EXPECT_EQ(j.at("problem"), 1);
    EXPECT_EQ(j.at("problem_title"), "Reverse");
    EXPECT_EQ(j.at("state"), "Completed");
    EXPECT_EQ(j.at("passed"), 2);
    EXPECT_EQ(j.at("failed"), 1);
    EXPECT_EQ(j.at("score"), 50.0);
    EXPECT_EQ(j.at("success"), false);
    EXPECT_EQ(j.at("time"), "1970-01-01T00:00:00Z");

    json update = server_event(score_update{"alice", 150.0, {problem_state::PASS, problem_state::IN_PROGRESS}, time});
    EXPECT_EQ(update, (json{{"kind", "score_update"}, {"submitter", "alice"}, {"score", 150.0},
                            {"states", json::array({"Pass", "InProgress"})}, {"time", "1970-01-01T00:00:00Z"}}));

    json a = server_event(announcement{"judges", "Problem B clarified", time});
    EXPECT_EQ(a, (json{{"kind", "announcement"}, {"announcer", "judges"}, {"message", "Problem B clarified"}, {"time", "1970-01-01T00:00:00Z"}}));
}

TEST(EventDispatcherTest, DeliversInOrderToAllHandlers) {
    event_dispatcher dispatcher;
    mutex mut;
    vector<string> first, second;
    dispatcher.add_handler([&](const server_event &event) {
        scoped_lock lock(mut);
        first.push_back(get<announcement>(event).message);
    });
    dispatcher.add_handler([&](const server_event &event) {
        scoped_lock lock(mut);
        second.push_back(get<announcement>(event).message);
    });
    dispatcher.start();

    for (int i = 0; i < 100; ++i)
        dispatcher.publish(make_announcement(to_string(i)));
    dispatcher.stop();

    ASSERT_EQ(first.size(), 100u);
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(first[i], to_string(i));
    EXPECT_EQ(first, second);
}

TEST(EventDispatcherTest, ThrowingHandlerDoesNotAffectOthers) {
    event_dispatcher dispatcher;
    atomic<int> delivered{0};
    dispatcher.add_handler([](const server_event &) { throw runtime_error("handler failure"); });
    dispatcher.add_handler([&](const server_event &) { ++delivered; });
    dispatcher.start();

    dispatcher.publish(make_announcement("a"));
    dispatcher.publish(make_announcement("b"));
    dispatcher.stop();
    EXPECT_EQ(delivered.load(), 2);
}

TEST(EventDispatcherTest, PublishDoesNotBlockOnSlowHandler) {
    event_dispatcher dispatcher;
    atomic<bool> release{false};
    atomic<int> delivered{0};
    dispatcher.add_handler([&](const server_event &) {
        arbiter::test::wait_until([&] { return release.load(); });
        ++delivered;
    });
    dispatcher.start();

    elapsed_time timer;
    for (int i = 0; i < 10; ++i)
        dispatcher.publish(make_announcement("slow"));
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 1000);

    release = true;
    dispatcher.stop();
    EXPECT_EQ(delivered.load(), 10);
}

TEST(EventDispatcherTest, PublishAfterStopIsDropped) {
    event_dispatcher dispatcher;
    atomic<int> delivered{0};
    dispatcher.add_handler([&](const server_event &) { ++delivered; });
    dispatcher.start();
    dispatcher.stop();

    dispatcher.publish(make_announcement("late"));
    EXPECT_EQ(delivered.load(), 0);
}

TEST(EventDispatcherTest, HandlersCannotBeAddedWhileRunning) {
    event_dispatcher dispatcher;
    dispatcher.start();
    EXPECT_THROW(dispatcher.add_handler([](const server_event &) {}), internal_error);
    dispatcher.stop();
}

TEST(EventDispatcherTest, BlockedHandlerDoesNotDelayOthers) {
    event_dispatcher dispatcher;
    atomic<bool> release{false};
    atomic<int> blocked_delivered{0}, delivered{0};
    dispatcher.add_handler([&](const server_event &) {
        arbiter::test::wait_until([&] { return release.load(); }, chrono::milliseconds(30000));
        ++blocked_delivered;
    }, "blocked");
    dispatcher.add_handler([&](const server_event &) { ++delivered; }, "subscribers");
    dispatcher.start();

    for (int i = 0; i < 5; ++i)
        dispatcher.publish(make_announcement(to_string(i)));
    EXPECT_TRUE(arbiter::test::wait_until([&] { return delivered.load() == 5; }, chrono::milliseconds(2000)));
    EXPECT_EQ(blocked_delivered.load(), 0);

    release = true;
    dispatcher.stop();
    EXPECT_EQ(blocked_delivered.load(), 5);
}

class CommandHookTest : public ::testing::Test {
protected:
    static sandbox::process_sandbox *sb;

    static void SetUpTestCase() {
        sb = new sandbox::process_sandbox();
    }

    static void TearDownTestCase() {
        delete sb;
        sb = nullptr;
    }

    scratch_directory dir{arbiter::test::scratch_root()};

    filesystem::path write_hook(const string &body) {
        auto path = dir.path() / "hook.sh";
        write_file_content(path, "#!/bin/sh\n" + body);
        filesystem::permissions(path, filesystem::perms::owner_all);
        return path;
    }

    command_hook make_hook(const string &body, chrono::milliseconds timeout = chrono::milliseconds(5000)) {
        return command_hook(*sb, write_hook(body), timeout);
    }
};

sandbox::process_sandbox *CommandHookTest::sb = nullptr;

TEST_F(CommandHookTest, PassesEventToProgram) {
    auto output = dir.path() / "received";
    auto hook = make_hook("printf '%s\\n%s' \"$1\" \"$ARBITER_EVENT\" > " + output.string() + "\n");

    hook(check_in{"alice", event_time()});

    string received = read_file_content(output);
    auto newline = received.find('\n');
    ASSERT_NE(newline, string::npos);
    EXPECT_EQ(received.substr(0, newline), "check_in");
    EXPECT_EQ(json::parse(received.substr(newline + 1)),
              (json{{"kind", "check_in"}, {"name", "alice"}, {"time", "1970-01-01T00:00:00Z"}}));
}

TEST_F(CommandHookTest, FailingProgramThrows) {
    auto hook = make_hook("exit 2\n");
    EXPECT_THROW(hook(check_in{"alice", event_time()}), runtime_error);
}

TEST_F(CommandHookTest, MissingProgramThrows) {
    command_hook hook(*sb, dir.path() / "missing.sh", chrono::milliseconds(1000));
    EXPECT_THROW(hook(check_in{"alice", event_time()}), runtime_error);
}

TEST_F(CommandHookTest, HangingProgramIsKilled) {
    auto hook = make_hook("sleep 30\n", chrono::milliseconds(200));
    elapsed_time timer;
    EXPECT_THROW(hook(check_in{"alice", event_time()}), runtime_error);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
}

TEST_F(CommandHookTest, FailingHookIsLoggedByDispatcher) {
    event_dispatcher dispatcher;
    atomic<int> delivered{0};
    dispatcher.add_handler(make_hook("exit 1\n"), "hook");
    dispatcher.add_handler([&](const server_event &) { ++delivered; }, "subscribers");
    dispatcher.start();
    dispatcher.publish(check_in{"alice", event_time()});
    dispatcher.stop();
    EXPECT_EQ(delivered.load(), 1);
}

TEST_F(CommandHookTest, SlowHookDoesNotDelaySubscribers) {
    event_dispatcher dispatcher;
    atomic<int> delivered{0};
    dispatcher.add_handler(make_hook("sleep 30\n", chrono::milliseconds(2000)), "hook");
    dispatcher.add_handler([&](const server_event &) { ++delivered; }, "subscribers");
    dispatcher.start();

    elapsed_time timer;
    dispatcher.publish(check_in{"alice", event_time()});
    dispatcher.publish(make_announcement("Problem B clarified"));
    ASSERT_TRUE(arbiter::test::wait_until([&] { return delivered.load() == 2; }, chrono::milliseconds(5000)));
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 1000);

    // 每个事件的钩子都会在 2 秒后被杀死
    dispatcher.stop();
    EXPECT_GE(timer.duration<chrono::milliseconds>().count(), 2000);
}
