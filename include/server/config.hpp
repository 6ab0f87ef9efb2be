/**
 * @file server/config.hpp
 * @brief Header file with server wide transfer policy
*/
#ifndef CONFIG_HPP
#define CONFIG_HPP

#define DEFAULT_TIMEOUT_MS 3000
#define DEFAULT_MAX_SEND_RETRIES 100

#include <chrono>
#include <cstdint>
#include <optional>

/**
 * @brief Configuration shared read-only by every transfer of one server
 * @note timeout - retransmission timeout used when the client does not negotiate one
 * @note blockSizeLimit - upper bound for negotiated block size
 * @note maxSendRetries - number of retransmissions of one packet before the transfer fails
 * @note ignoreClientTimeout - do not acknowledge timeout option, always use server timeout
 * @note ignoreClientBlockSize - do not acknowledge blksize option, always use 512 bytes
*/
struct ServerConfig {
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
    std::optional<uint16_t> blockSizeLimit;
    uint32_t maxSendRetries = DEFAULT_MAX_SEND_RETRIES;
    bool ignoreClientTimeout = false;
    bool ignoreClientBlockSize = false;
};

#endif
