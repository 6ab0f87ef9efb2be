/**
 * @file tests/packets_test.cpp
 * @brief Tests of TFTP packet parsing and serialization
*/
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "common/packets.hpp"
#include "common/exceptions.hpp"

static std::vector<char> bytes(const std::string& text) {
    return std::vector<char>(text.begin(), text.end());
}

TEST(PacketsTest, ParsesReadRequestWithOptions) {
    auto buffer = bytes(std::string("\x00\x01", 2) + "file.txt" + '\0' + "OCTET" + '\0' +
                        "BlkSize" + '\0' + "1024" + '\0' + "tsize" + '\0' + "0" + '\0');
    auto packet = Packet::parse(buffer);

    ASSERT_EQ(packet->getOpcode(), Opcode::RRQ);
    const auto& request = static_cast<const RequestPacket&>(*packet);
    EXPECT_EQ(request.filename, "file.txt");
    EXPECT_EQ(request.mode, DataMode::OCTET);
    ASSERT_TRUE(request.options.blockSize);
    EXPECT_EQ(*request.options.blockSize, 1024);
    EXPECT_FALSE(request.options.timeout);
    ASSERT_TRUE(request.options.transferSize);
    EXPECT_EQ(*request.options.transferSize, 0u);
}

TEST(PacketsTest, SerializesWriteRequest) {
    RequestOptions options;
    options.timeout = 5;
    WriteRequestPacket packet("a", DataMode::NETASCII, options);

    auto expected = bytes(std::string("\x00\x02", 2) + "a" + '\0' + "netascii" + '\0' + "timeout" + '\0' + "5" + '\0');
    EXPECT_EQ(packet.serialize(), expected);
}

TEST(PacketsTest, RequestRoundTrip) {
    RequestOptions options;
    options.blockSize = 1428;
    options.timeout = 3;
    options.transferSize = 123456789;
    ReadRequestPacket packet("dir/file.bin", DataMode::MAIL, options);

    auto parsed = Packet::parse(packet.serialize());
    ASSERT_EQ(parsed->getOpcode(), Opcode::RRQ);
    EXPECT_TRUE(static_cast<const RequestPacket&>(*parsed) == packet);
}

TEST(PacketsTest, UnknownOptionIsIgnored) {
    auto buffer = bytes(std::string("\x00\x01", 2) + "f" + '\0' + "octet" + '\0' + "windowsize" + '\0' + "4" + '\0');
    auto packet = Packet::parse(buffer);
    EXPECT_TRUE(static_cast<const RequestPacket&>(*packet).options.empty());
}

TEST(PacketsTest, InvalidOptionValueIsRejected) {
    auto buffer = bytes(std::string("\x00\x01", 2) + "f" + '\0' + "octet" + '\0' + "blksize" + '\0' + "abc" + '\0');
    EXPECT_THROW(Packet::parse(buffer), OptionError);

    auto tooLarge = bytes(std::string("\x00\x01", 2) + "f" + '\0' + "octet" + '\0' + "blksize" + '\0' + "70000" + '\0');
    EXPECT_THROW(Packet::parse(tooLarge), OptionError);
}

TEST(PacketsTest, DuplicateOptionIsRejected) {
    auto buffer = bytes(std::string("\x00\x01", 2) + "f" + '\0' + "octet" + '\0' +
                        "timeout" + '\0' + "1" + '\0' + "TIMEOUT" + '\0' + "2" + '\0');
    EXPECT_THROW(Packet::parse(buffer), OptionError);
}

TEST(PacketsTest, MalformedRequestsAreRejected) {
    // missing mode
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x01", 2) + "f" + '\0')), ParsingError);
    // unknown mode
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x01", 2) + "f" + '\0' + "binary" + '\0')), ParsingError);
    // empty filename
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x01\x00", 3) + "octet" + '\0')), ParsingError);
    // option without value
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x01", 2) + "f" + '\0' + "octet" + '\0' + "blksize" + '\0')), ParsingError);
}

TEST(PacketsTest, DataPacket) {
    DataPacket packet(258, {'a', 'b', 'c'});
    auto buffer = packet.serialize();
    EXPECT_EQ(buffer, bytes(std::string("\x00\x03\x01\x02", 4) + "abc"));

    auto parsed = Packet::parse(buffer);
    ASSERT_EQ(parsed->getOpcode(), Opcode::DATA);
    EXPECT_TRUE(static_cast<const DataPacket&>(*parsed) == packet);
}

TEST(PacketsTest, EmptyDataPacket) {
    auto parsed = Packet::parse(bytes(std::string("\x00\x03\xff\xff", 4)));
    const auto& data = static_cast<const DataPacket&>(*parsed);
    EXPECT_EQ(data.blockNumber, 65535);
    EXPECT_TRUE(data.data.empty());
}

TEST(PacketsTest, AckPacketMustHaveFourBytes) {
    auto parsed = Packet::parse(bytes(std::string("\x00\x04\x00\x07", 4)));
    ASSERT_EQ(parsed->getOpcode(), Opcode::ACK);
    EXPECT_EQ(static_cast<const ACKPacket&>(*parsed).blockNumber, 7);

    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x04\x00", 3))), ParsingError);
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x04\x00\x07\x00", 5))), ParsingError);
}

TEST(PacketsTest, ErrorPacket) {
    ErrorPacket packet(ErrorCode::FILE_NOT_FOUND, "File not found");
    auto buffer = packet.serialize();
    EXPECT_EQ(buffer, bytes(std::string("\x00\x05\x00\x01", 4) + "File not found" + '\0'));

    auto parsed = Packet::parse(buffer);
    ASSERT_EQ(parsed->getOpcode(), Opcode::ERROR);
    EXPECT_TRUE(static_cast<const ErrorPacket&>(*parsed) == packet);

    // message without terminator
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x05\x00\x01", 4) + "oops")), ParsingError);
}

TEST(PacketsTest, UnknownErrorCodeIsNotDefined) {
    auto parsed = Packet::parse(bytes(std::string("\x00\x05\x00\x63", 4) + "x" + '\0'));
    EXPECT_EQ(static_cast<const ErrorPacket&>(*parsed).errorCode, ErrorCode::NOT_DEFINED);
}

TEST(PacketsTest, OackPacketKeepsOptionOrder) {
    RequestOptions options;
    options.transferSize = 10;
    options.blockSize = 8;
    OACKPacket packet(options);
    auto buffer = packet.serialize();
    EXPECT_EQ(buffer, bytes(std::string("\x00\x06", 2) + "blksize" + '\0' + "8" + '\0' + "tsize" + '\0' + "10" + '\0'));

    auto parsed = Packet::parse(buffer);
    ASSERT_EQ(parsed->getOpcode(), Opcode::OACK);
    EXPECT_TRUE(static_cast<const OACKPacket&>(*parsed).options == options);
}

TEST(PacketsTest, UnknownOpcodeAndShortBuffers) {
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x09\x00\x01", 4))), ParsingError);
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00", 1))), ParsingError);
    EXPECT_THROW(Packet::parse(bytes(std::string("\x00\x03\x00", 3))), ParsingError);
}

TEST(PacketsTest, DescribeNamesPacket) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(6969);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    EXPECT_EQ(ACKPacket(3).describe(addr).rfind("ACK 127.0.0.1:6969", 0), 0u);
    EXPECT_NE(ReadRequestPacket("f", DataMode::OCTET).describe(addr).find("\"f\""), std::string::npos);
}
