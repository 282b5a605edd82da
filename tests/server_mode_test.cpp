#include "../common/config.hpp"
#include "../common/socket_utils.hpp"
#include "../sync/client_session.hpp"
#include "../sync/host_session.hpp"
#include "../sync/server_mode.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace testing_support;

namespace {

int connectWithRetry(const std::string& path) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        Result<int> connected = SocketUtils::connectUnix(path);
        if (connected.success) return connected.data;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return -1;
}

// Every session appends one line and lets the editor quit.
ServerMode::Handler appendingClient(std::atomic<int>& failures) {
    return [&failures](int clientSocket, int sessionId) {
        ScriptedEditor editor({[](const std::string& path) {
                                   writeFile(path, readFile(path) + "edited\n");
                                   return EditorEvent::SAVED;
                               },
                               ScriptedEditor::exit()});
        ClientOptions options;
        options.pollIntervalMs = 5;
        ClientSession session(clientSocket, sessionId, editor, options);
        if (!session.run().success) failures++;
    };
}

void runHosts(const std::string& socketPath, const std::vector<std::string>& files) {
    std::vector<std::thread> hosts;
    for (size_t i = 0; i < files.size(); ++i) {
        hosts.emplace_back([&socketPath, &files, i]() {
            int fd = connectWithRetry(socketPath);
            ASSERT_GE(fd, 0);
            HostSession host(fd, files[i], static_cast<int>(i));
            Result<void> result = host.run();
            EXPECT_TRUE(result.success) << result.message;
        });
    }
    for (std::thread& host : hosts) host.join();
}

void serveHosts(int maxSessions) {
    TempDir dir;
    std::string socketPath = dir.file("socket");
    std::vector<std::string> files = {dir.file("first.txt"), dir.file("second.txt"), dir.file("third.txt")};
    for (const std::string& file : files) writeFile(file, file.substr(file.rfind('/') + 1) + "\n");

    std::atomic<int> failures(0);
    ServerMode server(socketPath, appendingClient(failures), maxSessions);
    Result<void> served = Result<void>::Ok();
    std::thread serverThread([&]() { served = server.startServer(); });

    runHosts(socketPath, files);
    server.stop();
    serverThread.join();

    EXPECT_TRUE(served.success) << served.message;
    EXPECT_EQ(server.sessionsServed(), 3);
    EXPECT_EQ(failures.load(), 0);
    for (const std::string& file : files) {
        EXPECT_EQ(readFile(file), file.substr(file.rfind('/') + 1) + "\nedited\n");
    }
    EXPECT_FALSE(fileExists(socketPath));
}

} // namespace

TEST(ServerModeTest, ServesConcurrentHostsIndependently) {
    serveHosts(3);
}

TEST(ServerModeTest, SessionCapQueuesExtraHosts) {
    serveHosts(1);
}

TEST(ServerModeTest, StopWithoutConnections) {
    TempDir dir;
    std::atomic<int> failures(0);
    ServerMode server(dir.file("socket"), appendingClient(failures));
    Result<void> served = Result<void>::Error(ErrorCode::Io, "not run");
    std::thread serverThread([&]() { served = server.startServer(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    server.stop();
    serverThread.join();
    EXPECT_TRUE(served.success) << served.message;
    EXPECT_EQ(server.sessionsServed(), 0);
}

TEST(ServerModeTest, BindFailureIsReported) {
    TempDir dir;
    std::string notASocket = dir.file("plain");
    writeFile(notASocket, "data");
    std::atomic<int> failures(0);
    ServerMode server(notASocket, appendingClient(failures));

    Result<void> served = server.startServer();
    EXPECT_FALSE(served.success);
    EXPECT_EQ(served.code, ErrorCode::Io);
    EXPECT_EQ(readFile(notASocket), "data");
}

TEST(SocketUtilsTest, ResolvesSocketDirectoryAndChecksPermissions) {
    TempDir dir;
    std::string socketPath = dir.file("socket");
    mode_t previous = umask(0177);
    Result<int> listening = SocketUtils::listenUnix(socketPath, 1);
    umask(previous);
    ASSERT_TRUE(listening.success) << listening.message;
    int fd = listening.data;

    Result<std::string> viaDirectory = SocketUtils::resolveSocketPath(dir.path());
    ASSERT_TRUE(viaDirectory.success) << viaDirectory.message;
    EXPECT_EQ(viaDirectory.data, socketPath);

    Result<std::string> direct = SocketUtils::resolveSocketPath(socketPath);
    ASSERT_TRUE(direct.success) << direct.message;
    EXPECT_EQ(direct.data, socketPath);

    ASSERT_EQ(chmod(socketPath.c_str(), 0666), 0);
    Result<std::string> permissive = SocketUtils::resolveSocketPath(socketPath);
    EXPECT_FALSE(permissive.success);

    Result<std::string> missing = SocketUtils::resolveSocketPath(dir.file("nothing"));
    EXPECT_FALSE(missing.success);

    writeFile(dir.file("regular"), "x");
    EXPECT_FALSE(SocketUtils::resolveSocketPath(dir.file("regular")).success);

    SocketUtils::closeSocket(fd);
    EXPECT_EQ(fd, -1);
}

TEST(SocketUtilsTest, SocketDirectoryWorksUnderUserOnlyUmask) {
    mode_t previous = umask(Config::USER_ONLY_UMASK);
    Result<std::string> socketPath = SocketUtils::makeSocketDirectory();
    Result<int> listening = Result<int>::Error(ErrorCode::Io, "not run");
    if (socketPath.success) listening = SocketUtils::listenUnix(socketPath.data, 1);
    umask(previous);
    ASSERT_TRUE(socketPath.success) << socketPath.message;
    ASSERT_TRUE(listening.success) << listening.message;

    std::string directory = socketPath.data.substr(0, socketPath.data.rfind('/'));
    struct stat st{};
    ASSERT_EQ(stat(directory.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);

    Result<std::string> resolved = SocketUtils::resolveSocketPath(directory);
    EXPECT_TRUE(resolved.success) << resolved.message;

    int fd = listening.data;
    SocketUtils::closeSocket(fd);
    ::unlink(socketPath.data.c_str());
    ::rmdir(directory.c_str());
}

TEST(SocketUtilsTest, WaitReadableTimesOutThenSeesData) {
    SocketPair sockets;
    Result<bool> idle = SocketUtils::waitReadable(sockets.first(), 10);
    ASSERT_TRUE(idle.success);
    EXPECT_FALSE(idle.data);

    ASSERT_TRUE(writeRaw(sockets.second(), "x"));
    Result<bool> ready = SocketUtils::waitReadable(sockets.first(), 1000);
    ASSERT_TRUE(ready.success);
    EXPECT_TRUE(ready.data);
}
