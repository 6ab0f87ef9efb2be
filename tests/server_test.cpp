/**
 * @file tests/server_test.cpp
 * @brief End-to-end tests of TFTP server serving a temporary directory
*/
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "server/tftp_server.hpp"
#include "server/dir_handler.hpp"
#include "common/socket.hpp"

namespace fs = std::filesystem;

class ServerTest : public ::testing::Test {
protected:
    fs::path root;
    std::unique_ptr<TFTPServer> server;
    std::future<void> serverResult;
    sockaddr_in serverAddr;
    UdpSocket clientSocket{makeAddress("127.0.0.1", 0)};

    void SetUp() override {
        root = fs::temp_directory_path() / ("tftpd_server_test_" + std::to_string(getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root);

        auto handler = std::make_shared<DirHandler>(root.string());
        server = std::make_unique<TFTPServer>(makeAddress("127.0.0.1", 0), handler);
        serverAddr = server->listenAddress();
        serverResult = std::async(std::launch::async, [this]() { server->start(); });
    }

    void TearDown() override {
        server->stop();
        serverResult.get();
        server.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::unique_ptr<Packet> receive(sockaddr_in& from, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::vector<char> buffer(BUFFER_SIZE);
        auto size = clientSocket.receiveFrom(buffer.data(), buffer.size(), from, timeout);
        if (!size) {
            return nullptr;
        }
        return Packet::parse(buffer.data(), *size);
    }

    bool waitUntilIdle() {
        for (int i = 0; i < 50; ++i) {
            if (server->inFlight() == 0) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }
};

TEST_F(ServerTest, DownloadsFile) {
    std::string content(700, 'q');
    {
        std::ofstream out(root / "data.bin", std::ios::binary);
        out << content;
    }
    clientSocket.sendTo(ReadRequestPacket("data.bin", DataMode::OCTET).serialize(), serverAddr);

    std::string received;
    sockaddr_in transferAddr;
    uint16_t expectedBlock = 1;
    while (true) {
        auto packet = receive(transferAddr);
        ASSERT_TRUE(packet);
        ASSERT_EQ(packet->getOpcode(), Opcode::DATA);
        const auto& data = static_cast<const DataPacket&>(*packet);
        ASSERT_EQ(data.blockNumber, expectedBlock);
        // transfer runs on its own port
        EXPECT_NE(transferAddr.sin_port, serverAddr.sin_port);
        received.append(data.data.begin(), data.data.end());
        clientSocket.sendTo(ACKPacket(data.blockNumber).serialize(), transferAddr);
        if (data.data.size() < DEFAULT_BLOCK_SIZE) {
            break;
        }
        ++expectedBlock;
    }

    EXPECT_EQ(received, content);
    EXPECT_TRUE(waitUntilIdle());
}

TEST_F(ServerTest, UploadsFile) {
    RequestOptions options;
    options.blockSize = 100;
    options.transferSize = 150;
    clientSocket.sendTo(WriteRequestPacket("upload.txt", DataMode::OCTET, options).serialize(), serverAddr);

    sockaddr_in transferAddr;
    auto oack = receive(transferAddr);
    ASSERT_TRUE(oack);
    ASSERT_EQ(oack->getOpcode(), Opcode::OACK);
    const auto& acknowledged = static_cast<const OACKPacket&>(*oack).options;
    ASSERT_TRUE(acknowledged.blockSize);
    EXPECT_EQ(*acknowledged.blockSize, 100);
    ASSERT_TRUE(acknowledged.transferSize);
    EXPECT_EQ(*acknowledged.transferSize, 150u);

    clientSocket.sendTo(DataPacket(1, std::vector<char>(100, 'a')).serialize(), transferAddr);
    auto ack1 = receive(transferAddr);
    ASSERT_TRUE(ack1);
    ASSERT_EQ(ack1->getOpcode(), Opcode::ACK);
    EXPECT_EQ(static_cast<const ACKPacket&>(*ack1).blockNumber, 1);

    clientSocket.sendTo(DataPacket(2, std::vector<char>(50, 'b')).serialize(), transferAddr);
    auto ack2 = receive(transferAddr);
    ASSERT_TRUE(ack2);
    ASSERT_EQ(ack2->getOpcode(), Opcode::ACK);
    EXPECT_EQ(static_cast<const ACKPacket&>(*ack2).blockNumber, 2);

    ASSERT_TRUE(waitUntilIdle());
    std::ifstream in(root / "upload.txt", std::ios::binary);
    std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(written, std::string(100, 'a') + std::string(50, 'b'));
}

TEST_F(ServerTest, MissingFileGetsError) {
    clientSocket.sendTo(ReadRequestPacket("missing.txt", DataMode::OCTET).serialize(), serverAddr);

    sockaddr_in from;
    auto packet = receive(from);
    ASSERT_TRUE(packet);
    ASSERT_EQ(packet->getOpcode(), Opcode::ERROR);
    EXPECT_EQ(static_cast<const ErrorPacket&>(*packet).errorCode, ErrorCode::FILE_NOT_FOUND);
    EXPECT_TRUE(waitUntilIdle());
}

TEST_F(ServerTest, InvalidOptionGetsError) {
    {
        std::ofstream out(root / "small.txt");
        out << "x";
    }
    RequestOptions options;
    options.blockSize = 4;
    clientSocket.sendTo(ReadRequestPacket("small.txt", DataMode::OCTET, options).serialize(), serverAddr);

    sockaddr_in from;
    auto packet = receive(from);
    ASSERT_TRUE(packet);
    ASSERT_EQ(packet->getOpcode(), Opcode::ERROR);
    EXPECT_EQ(static_cast<const ErrorPacket&>(*packet).errorCode, ErrorCode::INVALID_OPTIONS);
}

TEST_F(ServerTest, DuplicateRequestIsIgnored) {
    {
        std::ofstream out(root / "dup.txt");
        out << std::string(600, 'd');
    }
    auto request = ReadRequestPacket("dup.txt", DataMode::OCTET).serialize();
    clientSocket.sendTo(request, serverAddr);
    clientSocket.sendTo(request, serverAddr);

    sockaddr_in transferAddr;
    auto first = receive(transferAddr);
    ASSERT_TRUE(first);
    ASSERT_EQ(first->getOpcode(), Opcode::DATA);
    EXPECT_EQ(static_cast<const DataPacket&>(*first).blockNumber, 1);

    sockaddr_in from;
    EXPECT_FALSE(receive(from, std::chrono::milliseconds(300)));
    EXPECT_EQ(server->inFlight(), 1u);

    clientSocket.sendTo(ACKPacket(1).serialize(), transferAddr);
    auto second = receive(transferAddr);
    ASSERT_TRUE(second);
    ASSERT_EQ(second->getOpcode(), Opcode::DATA);
    EXPECT_EQ(static_cast<const DataPacket&>(*second).blockNumber, 2);
    clientSocket.sendTo(ACKPacket(2).serialize(), transferAddr);
    EXPECT_TRUE(waitUntilIdle());
}

TEST_F(ServerTest, NonRequestPacketsAreIgnored) {
    clientSocket.sendTo(ACKPacket(1).serialize(), serverAddr);
    clientSocket.sendTo(std::vector<char>{'\0', '\x09', 'x'}, serverAddr);

    sockaddr_in from;
    EXPECT_FALSE(receive(from, std::chrono::milliseconds(300)));
    EXPECT_EQ(server->inFlight(), 0u);
}

TEST_F(ServerTest, StopReturnsFromStart) {
    server->stop();
    EXPECT_EQ(serverResult.wait_for(std::chrono::seconds(2)), std::future_status::ready);
}
