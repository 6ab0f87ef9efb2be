/**
 * @file common/exceptions.cpp
 * @brief Mapping of errors raised by data sources and sinks to TFTP error codes
*/
#include "common/exceptions.hpp"
#include <cerrno>
#include <filesystem>
#include <system_error>

static ErrorCode errnoToErrorCode(int error) {
    switch (error) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FILE_NOT_FOUND;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::ACCESS_VIOLATION;
        case EEXIST:
            return ErrorCode::FILE_ALREADY_EXISTS;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return ErrorCode::DISK_FULL;
        default:
            return ErrorCode::NOT_DEFINED;
    }
}

TransferError toTransferError(const std::exception& e) {
    if (auto transferError = dynamic_cast<const TransferError*>(&e)) {
        return *transferError;
    }
    if (auto systemError = dynamic_cast<const std::system_error*>(&e)) {
        // std::filesystem::filesystem_error is a std::system_error too
        if (systemError->code().category() == std::generic_category() ||
            systemError->code().category() == std::system_category()) {
            return TransferError(errnoToErrorCode(systemError->code().value()), systemError->what());
        }
    }
    return TransferError(ErrorCode::NOT_DEFINED, e.what());
}
