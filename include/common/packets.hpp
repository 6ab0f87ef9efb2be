/**
 * @file common/packets.hpp
 * @brief Header file with declaration for packets and their wire encoding
*/

#ifndef PACKETS_HPP
#define PACKETS_HPP

#define BUFFER_SIZE 65507
#define MAX_BLOCK_SIZE 65464
#define MIN_BLOCK_SIZE 8
#define DEFAULT_BLOCK_SIZE 512
#define MIN_TIMEOUT 1

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <netinet/in.h>

/**
 * @brief Enum for error codes
*/
enum ErrorCode {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND = 1,
    ACCESS_VIOLATION = 2,
    DISK_FULL = 3,
    ILLEGAL_OPERATION = 4,
    UNKNOWN_TID = 5,
    FILE_ALREADY_EXISTS = 6,
    NO_SUCH_USER = 7,
    INVALID_OPTIONS = 8
};

/**
 * @brief Enum for opcodes
*/
enum Opcode {
    RRQ = 1,
    WRQ = 2,
    DATA = 3,
    ACK = 4,
    ERROR = 5,
    OACK = 6
};

/**
 * @brief Enum for data modes
*/
enum DataMode {
    NETASCII,
    OCTET,
    MAIL
};

/**
 * @brief Function for converting mode enum to string
 * @param value Mode to convert
 * @return mode as a string
*/
std::string modeToString(DataMode value);

/**
 * @brief Function for converting string to mode enum, comparison is case insensitive
 * @param value String to convert
 * @return DataMode
 * @throws ParsingError if the mode is not known
*/
DataMode stringToMode(std::string value);

/**
 * @brief Function for formatting address as ip:port
*/
std::string addressToString(const sockaddr_in& addr);

/**
 * @brief Options carried by RRQ/WRQ and OACK packets
 * @note blockSize - blksize option (RFC 2348)
 * @note timeout - timeout option in seconds (RFC 2349)
 * @note transferSize - tsize option in bytes (RFC 2349)
*/
struct RequestOptions {
    std::optional<uint16_t> blockSize;
    std::optional<uint8_t> timeout;
    std::optional<uint64_t> transferSize;

    bool empty() const;
    std::string toString() const;
    bool operator==(const RequestOptions& other) const;
    bool operator!=(const RequestOptions& other) const { return !(*this == other); }
};

/**
 * @class Packet
 * @brief This class is an abstract base class for all packet classes, declare virtual functions which should be implemented
 * by all packet classes
*/
class Packet {
public:
    virtual ~Packet() = default;
    /**
     * @brief Function for serialize packet to vector of char before sending
     * @return Vector of char
    */
    virtual std::vector<char> serialize() const = 0;
    /**
     * @brief Function to get opcode of packet
    */
    virtual Opcode getOpcode() const = 0;
    /**
     * @brief Function for describing packet in log messages
     * @param addr The address of the peer
    */
    virtual std::string describe(const sockaddr_in& addr) const = 0;
    /**
     * @brief Function which returns unique pointer on packet based on opcode of the packet
     * @param buffer The buffer received from socket
     * @param bufferSize The size of buffer
     * @return Unique pointer to packet
     * @throws ParsingError if packet is not valid, OptionError if option value is not valid
    */
    static std::unique_ptr<Packet> parse(const char* buffer, size_t bufferSize);
    static std::unique_ptr<Packet> parse(const std::vector<char>& buffer);
};

/**
 * @brief Class for represent RRQ/WRQ packets
 * @note filename - path to file on server
 * @note mode - mode of transfer (netascii, octet, mail)
 * @note options - requested options, unsupported options are dropped while parsing
*/
class RequestPacket : public Packet {
public:
    std::string filename;
    DataMode mode;
    RequestOptions options;
    RequestPacket(const std::string& filename, DataMode mode, const RequestOptions& options);
    std::vector<char> serialize() const override;
    std::string describe(const sockaddr_in& addr) const override;
    static std::unique_ptr<RequestPacket> parse(const char* buffer, size_t bufferSize);
    bool operator==(const RequestPacket& other) const;
};

/**
 * @brief Class for represent RRQ packets
*/
class ReadRequestPacket : public RequestPacket {
public:
    ReadRequestPacket(const std::string& filename, DataMode mode, const RequestOptions& options = RequestOptions());
    Opcode getOpcode() const override { return Opcode::RRQ; }
};

/**
 * @brief Class for represent WRQ packets
*/
class WriteRequestPacket : public RequestPacket {
public:
    WriteRequestPacket(const std::string& filename, DataMode mode, const RequestOptions& options = RequestOptions());
    Opcode getOpcode() const override { return Opcode::WRQ; }
};

/**
 * @brief Class for represent DATA packets
 * @note blockNumber - number of block
 * @note data - payload, empty for the final block of a file with size multiple of block size
*/
class DataPacket : public Packet {
public:
    uint16_t blockNumber;
    std::vector<char> data;
    DataPacket(uint16_t blockNumber, const std::vector<char>& data);
    std::vector<char> serialize() const override;
    std::string describe(const sockaddr_in& addr) const override;
    static DataPacket parse(const char* buffer, size_t bufferSize);
    Opcode getOpcode() const override { return Opcode::DATA; }
    bool operator==(const DataPacket& other) const;
};

/**
 * @brief Class for represent ACK packets
*/
class ACKPacket : public Packet {
public:
    uint16_t blockNumber;
    explicit ACKPacket(uint16_t blockNumber);
    std::vector<char> serialize() const override;
    std::string describe(const sockaddr_in& addr) const override;
    static ACKPacket parse(const char* buffer, size_t bufferSize);
    Opcode getOpcode() const override { return Opcode::ACK; }
    bool operator==(const ACKPacket& other) const;
};

/**
 * @brief Class for represent ERROR packets
 * @note Unknown error codes are parsed as NOT_DEFINED
*/
class ErrorPacket : public Packet {
public:
    ErrorCode errorCode;
    std::string errorMessage;
    ErrorPacket(ErrorCode errorCode, const std::string& errorMessage);
    std::vector<char> serialize() const override;
    std::string describe(const sockaddr_in& addr) const override;
    static ErrorPacket parse(const char* buffer, size_t bufferSize);
    Opcode getOpcode() const override { return Opcode::ERROR; }
    bool operator==(const ErrorPacket& other) const;
};

/**
 * @brief Class for represent OACK packets
 * @note options - acknowledged options
*/
class OACKPacket : public Packet {
public:
    RequestOptions options;
    explicit OACKPacket(const RequestOptions& options);
    std::vector<char> serialize() const override;
    std::string describe(const sockaddr_in& addr) const override;
    static OACKPacket parse(const char* buffer, size_t bufferSize);
    Opcode getOpcode() const override { return Opcode::OACK; }
    bool operator==(const OACKPacket& other) const;
};

#endif // PACKETS_HPP
