/**
 * @file common/packets.cpp
 * @brief Implementation of packet parsing and serialization
*/
#include "common/packets.hpp"
#include "common/exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <vector>
#include <arpa/inet.h>

std::string modeToString(DataMode value) {
    switch (value) {
        case DataMode::NETASCII: return "netascii";
        case DataMode::OCTET: return "octet";
        case DataMode::MAIL: return "mail";
        default: return "unknown";
    }
}

DataMode stringToMode(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);

    if (value == "netascii") {
        return DataMode::NETASCII;
    } else if (value == "octet") {
        return DataMode::OCTET;
    } else if (value == "mail") {
        return DataMode::MAIL;
    } else {
        throw ParsingError("Invalid mode");
    }
}

std::string addressToString(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

static uint16_t readUint16(const char* buffer) {
    return (static_cast<uint8_t>(buffer[0]) << 8) | static_cast<uint8_t>(buffer[1]);
}

static void writeUint16(std::vector<char>& buffer, uint16_t value) {
    buffer.push_back(static_cast<char>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<char>(value & 0xFF));
}

static void writeString(std::vector<char>& buffer, const std::string& value) {
    buffer.insert(buffer.end(), value.begin(), value.end());
    buffer.push_back('\0');
}

/**
 * @brief Function for parsing numeric option value, only plain decimal digits are accepted
 * @throws OptionError if the value is not a number or it does not fit into T
*/
template <typename T>
static T parseOptionValue(const std::string& name, const std::string& value) {
    bool digitsOnly = std::all_of(value.begin(), value.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (value.empty() || !digitsOnly) {
        throw OptionError("Invalid value of option " + name);
    }

    uint64_t parsed;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw OptionError("Value of option " + name + " is out of range");
    }
    if (parsed > std::numeric_limits<T>::max()) {
        throw OptionError("Value of option " + name + " is out of range");
    }
    return static_cast<T>(parsed);
}

/**
 * @brief Function for parsing option name/value pairs from current to end
 * @note Unsupported options are skipped
*/
static RequestOptions parseOptions(const char* current, const char* end) {
    RequestOptions options;
    while (current < end) {
        const char* optionEnd = std::find(current, end, '\0');
        std::string optionName(current, optionEnd);
        std::transform(optionName.begin(), optionName.end(), optionName.begin(), ::tolower);

        if (optionName.empty() || optionEnd == end) {
            throw ParsingError("Invalid option name");
        }
        current = optionEnd + 1;

        const char* valueEnd = std::find(current, end, '\0');
        if (valueEnd == end) {
            throw ParsingError("Missing value of option " + optionName);
        }
        std::string optionValue(current, valueEnd);
        current = valueEnd + 1;

        if (optionName == "blksize") {
            if (options.blockSize) {
                throw OptionError("Option occurs multiple times");
            }
            options.blockSize = parseOptionValue<uint16_t>(optionName, optionValue);
        } else if (optionName == "timeout") {
            if (options.timeout) {
                throw OptionError("Option occurs multiple times");
            }
            options.timeout = parseOptionValue<uint8_t>(optionName, optionValue);
        } else if (optionName == "tsize") {
            if (options.transferSize) {
                throw OptionError("Option occurs multiple times");
            }
            options.transferSize = parseOptionValue<uint64_t>(optionName, optionValue);
        }
    }
    return options;
}

static void serializeOptions(std::vector<char>& buffer, const RequestOptions& options) {
    if (options.blockSize) {
        writeString(buffer, "blksize");
        writeString(buffer, std::to_string(*options.blockSize));
    }
    if (options.timeout) {
        writeString(buffer, "timeout");
        writeString(buffer, std::to_string(*options.timeout));
    }
    if (options.transferSize) {
        writeString(buffer, "tsize");
        writeString(buffer, std::to_string(*options.transferSize));
    }
}

// REQUEST OPTIONS
bool RequestOptions::empty() const {
    return !blockSize && !timeout && !transferSize;
}

std::string RequestOptions::toString() const {
    std::string result;
    if (blockSize) {
        result += " blksize=" + std::to_string(*blockSize);
    }
    if (timeout) {
        result += " timeout=" + std::to_string(*timeout);
    }
    if (transferSize) {
        result += " tsize=" + std::to_string(*transferSize);
    }
    return result;
}

bool RequestOptions::operator==(const RequestOptions& other) const {
    return blockSize == other.blockSize && timeout == other.timeout && transferSize == other.transferSize;
}

// PACKET
std::unique_ptr<Packet> Packet::parse(const char* buffer, size_t bufferSize) {
    if (bufferSize < 2) {
        throw ParsingError("Buffer too short to determine opcode");
    }

    uint16_t opcode = readUint16(buffer);

    switch (opcode) {
        case Opcode::RRQ:
        case Opcode::WRQ:
            return RequestPacket::parse(buffer, bufferSize);
        case Opcode::DATA:
            return std::make_unique<DataPacket>(DataPacket::parse(buffer, bufferSize));
        case Opcode::ACK:
            return std::make_unique<ACKPacket>(ACKPacket::parse(buffer, bufferSize));
        case Opcode::ERROR:
            return std::make_unique<ErrorPacket>(ErrorPacket::parse(buffer, bufferSize));
        case Opcode::OACK:
            return std::make_unique<OACKPacket>(OACKPacket::parse(buffer, bufferSize));
        default:
            throw ParsingError("Unknown or unhandled TFTP opcode");
    }
}

std::unique_ptr<Packet> Packet::parse(const std::vector<char>& buffer) {
    return parse(buffer.data(), buffer.size());
}

// REQUEST PACKET
RequestPacket::RequestPacket(const std::string& filename, DataMode mode, const RequestOptions& options)
    : filename(filename), mode(mode), options(options) {}

std::unique_ptr<RequestPacket> RequestPacket::parse(const char* buffer, size_t bufferSize) {
    if (bufferSize < 4) {
        throw ParsingError("Buffer too short for request packet");
    }
    uint16_t opcode = readUint16(buffer);
    const char* end = buffer + bufferSize;
    const char* current = buffer + 2;

    const char* filenameEnd = std::find(current, end, '\0');
    std::string filename(current, filenameEnd);
    if (filename.empty() || filenameEnd == end) {
        throw ParsingError("Invalid filename");
    }
    current = filenameEnd + 1;

    const char* modeEnd = std::find(current, end, '\0');
    std::string modeStr(current, modeEnd);
    if (modeStr.empty() || modeEnd == end) {
        throw ParsingError("Invalid mode");
    }
    current = modeEnd + 1;
    DataMode mode = stringToMode(modeStr);

    RequestOptions options = parseOptions(current, end);

    if (opcode == Opcode::RRQ) {
        return std::make_unique<ReadRequestPacket>(filename, mode, options);
    }
    return std::make_unique<WriteRequestPacket>(filename, mode, options);
}

std::vector<char> RequestPacket::serialize() const {
    std::vector<char> buffer;
    writeUint16(buffer, getOpcode());
    writeString(buffer, filename);
    writeString(buffer, modeToString(mode));
    serializeOptions(buffer, options);
    return buffer;
}

std::string RequestPacket::describe(const sockaddr_in& addr) const {
    std::string name = getOpcode() == Opcode::RRQ ? "RRQ " : "WRQ ";
    return name + addressToString(addr) + " \"" + filename + "\" " + modeToString(mode) + options.toString();
}

bool RequestPacket::operator==(const RequestPacket& other) const {
    return getOpcode() == other.getOpcode() && filename == other.filename && mode == other.mode && options == other.options;
}

ReadRequestPacket::ReadRequestPacket(const std::string& filename, DataMode mode, const RequestOptions& options)
    : RequestPacket(filename, mode, options) {}

WriteRequestPacket::WriteRequestPacket(const std::string& filename, DataMode mode, const RequestOptions& options)
    : RequestPacket(filename, mode, options) {}

// DATA PACKET
DataPacket::DataPacket(uint16_t blockNumber, const std::vector<char>& data)
    : blockNumber(blockNumber), data(data) {}

DataPacket DataPacket::parse(const char* buffer, size_t bufferSize) {
    if (bufferSize < 4) {
        throw ParsingError("Buffer too short for DATA packet");
    }
    uint16_t blockNumber = readUint16(buffer + 2);
    std::vector<char> data(buffer + 4, buffer + bufferSize);
    return DataPacket(blockNumber, data);
}

std::vector<char> DataPacket::serialize() const {
    std::vector<char> buffer;
    buffer.reserve(4 + data.size());
    writeUint16(buffer, Opcode::DATA);
    writeUint16(buffer, blockNumber);
    buffer.insert(buffer.end(), data.begin(), data.end());
    return buffer;
}

std::string DataPacket::describe(const sockaddr_in& addr) const {
    return "DATA " + addressToString(addr) + " " + std::to_string(blockNumber) + " (" + std::to_string(data.size()) + " bytes)";
}

bool DataPacket::operator==(const DataPacket& other) const {
    return blockNumber == other.blockNumber && data == other.data;
}

// ACK PACKET
ACKPacket::ACKPacket(uint16_t blockNumber) : blockNumber(blockNumber) {}

ACKPacket ACKPacket::parse(const char* buffer, size_t bufferSize) {
    if (bufferSize != 4) {
        throw ParsingError("Buffer size for ACK packet must be 4");
    }
    return ACKPacket(readUint16(buffer + 2));
}

std::vector<char> ACKPacket::serialize() const {
    std::vector<char> buffer;
    writeUint16(buffer, Opcode::ACK);
    writeUint16(buffer, blockNumber);
    return buffer;
}

std::string ACKPacket::describe(const sockaddr_in& addr) const {
    return "ACK " + addressToString(addr) + " " + std::to_string(blockNumber);
}

bool ACKPacket::operator==(const ACKPacket& other) const {
    return blockNumber == other.blockNumber;
}

// ERROR PACKET
ErrorPacket::ErrorPacket(ErrorCode errorCode, const std::string& errorMessage)
    : errorCode(errorCode), errorMessage(errorMessage) {}

ErrorPacket ErrorPacket::parse(const char* buffer, size_t bufferSize) {
    if (bufferSize < 5) {
        throw ParsingError("Buffer too short for ERROR packet");
    }

    uint16_t code = readUint16(buffer + 2);
    ErrorCode errorCode = code > ErrorCode::INVALID_OPTIONS ? ErrorCode::NOT_DEFINED : static_cast<ErrorCode>(code);

    const char* errorMessageEnd = std::find(buffer + 4, buffer + bufferSize, '\0');
    if (errorMessageEnd == buffer + bufferSize) {
        throw ParsingError("Invalid error message");
    }
    std::string errorMessage(buffer + 4, errorMessageEnd);
    return ErrorPacket(errorCode, errorMessage);
}

std::vector<char> ErrorPacket::serialize() const {
    std::vector<char> buffer;
    writeUint16(buffer, Opcode::ERROR);
    writeUint16(buffer, errorCode);
    writeString(buffer, errorMessage);
    return buffer;
}

std::string ErrorPacket::describe(const sockaddr_in& addr) const {
    return "ERROR " + addressToString(addr) + " " + std::to_string(errorCode) + " \"" + errorMessage + "\"";
}

bool ErrorPacket::operator==(const ErrorPacket& other) const {
    return errorCode == other.errorCode && errorMessage == other.errorMessage;
}

// OACK PACKET
OACKPacket::OACKPacket(const RequestOptions& options) : options(options) {}

OACKPacket OACKPacket::parse(const char* buffer, size_t bufferSize) {
    if (bufferSize < 2) {
        throw ParsingError("Buffer too short for OACK packet");
    }
    return OACKPacket(parseOptions(buffer + 2, buffer + bufferSize));
}

std::vector<char> OACKPacket::serialize() const {
    std::vector<char> buffer;
    writeUint16(buffer, Opcode::OACK);
    serializeOptions(buffer, options);
    return buffer;
}

std::string OACKPacket::describe(const sockaddr_in& addr) const {
    return "OACK " + addressToString(addr) + options.toString();
}

bool OACKPacket::operator==(const OACKPacket& other) const {
    return options == other.options;
}
