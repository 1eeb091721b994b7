/**
 * @file test_socket_client.cpp
 * @brief Unit tests for the OpenSSH-backed ssh_exec path of SocketProtocolClient.
 *
 * Stub shell scripts stand in for the ssh binary: they consume the batch
 * from stdin and print a fixed reply.
 */

#include "protocol/socket_client.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace fleetwatch;
using namespace std::chrono_literals;

class SshExecTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "fw_test_ssh_exec";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::string write_stub(const std::string& name, const std::string& body) {
        auto path = temp_dir_ / name;
        {
            std::ofstream ofs(path);
            ofs << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path.string();
    }

    Credentials credentials_{"public", "admin", ""};
};

TEST_F(SshExecTest, ReturnsStubOutput) {
    SocketProtocolClient client(write_stub("echo_ssh", "cat\necho saved"));
    auto output = client.ssh_exec("10.0.0.2", credentials_, "display version", 5000ms);
    ASSERT_TRUE(output.has_value()) << output.error().message;
    EXPECT_EQ(*output, "display version\nsaved\n");
}

TEST_F(SshExecTest, NonZeroExitIsTransportError) {
    SocketProtocolClient client(write_stub("failing_ssh", "cat >/dev/null\necho denied\nexit 255"));
    auto output = client.ssh_exec("10.0.0.2", credentials_, "save force", 5000ms);
    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code, ErrorCode::Transport);
    EXPECT_NE(output.error().message.find("255"), std::string::npos);
}

TEST_F(SshExecTest, HungSessionTimesOut) {
    SocketProtocolClient client(write_stub("hung_ssh", "cat >/dev/null\nexec sleep 30"));
    auto started = std::chrono::steady_clock::now();
    auto output = client.ssh_exec("10.0.0.2", credentials_, "save force", 500ms);
    ASSERT_FALSE(output.has_value());
    EXPECT_NE(output.error().message.find("timed out"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
}

TEST_F(SshExecTest, ConcurrentSessionsDoNotHoldEachOthersPipes) {
    auto fast_ssh = write_stub("fast_ssh", "cat >/dev/null\necho ok");
    auto slow_ssh = write_stub("slow_ssh", "cat >/dev/null\nsleep 3\necho slow");
    SocketProtocolClient fast(fast_ssh);
    SocketProtocolClient slow(slow_ssh);

    std::atomic<int> fast_calls{0};
    std::atomic<int> fast_failures{0};
    std::atomic<int> slow_failures{0};
    std::atomic<bool> slow_done{false};

    std::vector<std::jthread> slow_workers;
    for (int i = 0; i < 4; ++i) {
        slow_workers.emplace_back([&] {
            auto output = slow.ssh_exec("10.0.0.3", credentials_, "save force", 10000ms);
            if (!output) ++slow_failures;
        });
    }

    {
        std::vector<std::jthread> fast_workers;
        for (int i = 0; i < 4; ++i) {
            fast_workers.emplace_back([&] {
                while (!slow_done.load()) {
                    auto output = fast.ssh_exec("10.0.0.2", credentials_, "display version", 1500ms);
                    ++fast_calls;
                    if (!output || *output != "ok\n") ++fast_failures;
                }
            });
        }

        for (auto& worker : slow_workers) worker.join();
        slow_done.store(true);
    }

    EXPECT_GT(fast_calls.load(), 0);
    EXPECT_EQ(fast_failures.load(), 0);
    EXPECT_EQ(slow_failures.load(), 0);
}
