#include <gtest/gtest.h>
#include <ssh/exec_session.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>

// Listening socket that never accepts: TCP connects, SSH never answers.
class SilentServerTest : public ::testing::Test {
protected:
    int listener = -1;
    RemoteConfig remote;

    void SetUp() override {
        listener = socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(listener, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ASSERT_EQ(bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        ASSERT_EQ(listen(listener, 4), 0);
        socklen_t len = sizeof(addr);
        ASSERT_EQ(getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len), 0);

        remote.host = "127.0.0.1";
        remote.user = "tester";
        remote.port = ntohs(addr.sin_port);
        remote.password = std::string("secret");
        remote.timeout = 1;
        remote.command_timeout = 1;
    }

    void TearDown() override {
        if (listener >= 0) ::close(listener);
    }
};

TEST_F(SilentServerTest, ConnectGivesUpAtTheDeadline) {
    ExecSession session(remote);
    auto start = std::chrono::steady_clock::now();
    auto r = session.run("true");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.failed());
    EXPECT_NE(r.stderr_data.find("timed out"), std::string::npos) << r.stderr_data;
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    // a second attempt reconnects and fails the same way
    auto again = session.run("true");
    EXPECT_TRUE(again.failed());
}

TEST(ExecSession, RefusedConnectionFails) {
    int spare = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(spare, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(bind(spare, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(spare, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    ::close(spare);     // bound but never listened: the port now refuses

    RemoteConfig remote;
    remote.host = "127.0.0.1";
    remote.user = "tester";
    remote.port = ntohs(addr.sin_port);
    remote.timeout = 1;
    ExecSession session(remote);
    EXPECT_TRUE(session.run("true").failed());
}
