/**
 * @file server/options.hpp
 * @brief Header file with declaration for transfer option negotiation
*/
#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include "common/packets.hpp"
#include "server/config.hpp"

/**
 * @brief Enum for session types
*/
enum SessionType {
    READ,
    WRITE
};

/**
 * @brief Parameters of one transfer after negotiation
 * @note blockSize - size of DATA payload, a shorter payload ends the transfer
 * @note timeout - retransmission timeout
 * @note transferSize - file size reported to client (read) or declared by client (write)
 * @note oack - options acknowledged in OACK packet
 * @note oackRequired - OACK has to be sent instead of first DATA/ACK
*/
struct TransferOptions {
    uint16_t blockSize = DEFAULT_BLOCK_SIZE;
    std::chrono::milliseconds timeout{0};
    std::optional<uint64_t> transferSize;
    RequestOptions oack;
    bool oackRequired = false;
};

/**
 * @brief Function for negotiating options requested by client with server policy
 * @param requested Options from RRQ/WRQ packet
 * @param config Server configuration
 * @param sessionType Direction of the transfer
 * @param fileSize Size of the file reported by the data source, only used for read transfers
 * @return negotiated options
 * @throws TransferError with INVALID_OPTIONS if a requested value is not acceptable
*/
TransferOptions negotiateOptions(const RequestOptions& requested, const ServerConfig& config, SessionType sessionType, std::optional<uint64_t> fileSize);

#endif
