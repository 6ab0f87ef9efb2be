/**
 * @file server/options.cpp
 * @brief Implementation of transfer option negotiation
*/
#include "server/options.hpp"
#include "common/exceptions.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <string>

TransferOptions negotiateOptions(const RequestOptions& requested, const ServerConfig& config, SessionType sessionType, std::optional<uint64_t> fileSize) {
    TransferOptions result;
    result.timeout = config.timeout;

    if (requested.blockSize && !config.ignoreClientBlockSize) {
        uint16_t blockSize = *requested.blockSize;
        if (blockSize < MIN_BLOCK_SIZE) {
            throw TransferError(ErrorCode::INVALID_OPTIONS, "Block size " + std::to_string(blockSize) + " is too small");
        }
        blockSize = std::min<uint16_t>(blockSize, MAX_BLOCK_SIZE);
        if (config.blockSizeLimit) {
            blockSize = std::min(blockSize, *config.blockSizeLimit);
        }
        result.blockSize = blockSize;
        result.oack.blockSize = blockSize;
        result.oackRequired = true;
    }

    if (requested.timeout && !config.ignoreClientTimeout) {
        if (*requested.timeout < MIN_TIMEOUT) {
            throw TransferError(ErrorCode::INVALID_OPTIONS, "Timeout must be at least 1 second");
        }
        result.timeout = std::chrono::seconds(*requested.timeout);
        result.oack.timeout = *requested.timeout;
        result.oackRequired = true;
    }

    if (requested.transferSize) {
        switch (sessionType) {
            case SessionType::READ:
                // client asks for the size with tsize=0, other values are ignored
                if (*requested.transferSize == 0 && fileSize) {
                    result.transferSize = fileSize;
                    result.oack.transferSize = fileSize;
                    result.oackRequired = true;
                }
                break;
            case SessionType::WRITE:
                // declared size is echoed only when an OACK is sent for other options
                result.transferSize = requested.transferSize;
                result.oack.transferSize = requested.transferSize;
                break;
        }
    }

    Logger::instance().debug("Negotiated block size " + std::to_string(result.blockSize) + ", timeout " +
                             std::to_string(result.timeout.count()) + " ms" +
                             (result.oackRequired ? ", OACK" + result.oack.toString() : ""));
    return result;
}
