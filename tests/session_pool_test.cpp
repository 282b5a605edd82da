#include "../common/session_pool.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

using namespace testing_support;

TEST(SessionPoolTest, RunsEverySubmittedSession) {
    std::mutex mtx;
    std::set<int> seen;
    {
        SessionPool pool(2, [&](int clientSocket, int sessionId) {
            ::close(clientSocket);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            std::lock_guard<std::mutex> guard(mtx);
            seen.insert(sessionId);
        });
        EXPECT_EQ(pool.size(), 2u);
        for (int id = 0; id < 6; ++id) {
            SocketPair sockets;
            ASSERT_TRUE(pool.submit(sockets.releaseFirst(), id).success);
        }
        // queued sessions still run before the pool goes away
    }
    EXPECT_EQ(seen, (std::set<int>{0, 1, 2, 3, 4, 5}));
}

TEST(SessionPoolTest, SessionsRunConcurrentlyUpToWorkerCount) {
    std::atomic<int> running(0);
    std::atomic<int> peak(0);
    {
        SessionPool pool(3, [&](int clientSocket, int) {
            ::close(clientSocket);
            int now = ++running;
            int previous = peak.load();
            while (now > previous && !peak.compare_exchange_weak(previous, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            --running;
        });
        for (int id = 0; id < 6; ++id) {
            SocketPair sockets;
            ASSERT_TRUE(pool.submit(sockets.releaseFirst(), id).success);
        }
    }
    EXPECT_GE(peak.load(), 2);
    EXPECT_LE(peak.load(), 3);
}

TEST(SessionPoolTest, ZeroWorkersStillServes) {
    std::atomic<int> served(0);
    {
        SessionPool pool(0, [&](int clientSocket, int) {
            ::close(clientSocket);
            served++;
        });
        EXPECT_EQ(pool.size(), 1u);
        SocketPair sockets;
        ASSERT_TRUE(pool.submit(sockets.releaseFirst(), 0).success);
    }
    EXPECT_EQ(served.load(), 1);
}
