/**
 * @file tests/exceptions_test.cpp
 * @brief Tests of mapping failures to TFTP error codes
*/
#include <gtest/gtest.h>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include "common/exceptions.hpp"

static ErrorCode codeOf(int error) {
    return toTransferError(std::system_error(error, std::generic_category())).code;
}

TEST(ExceptionsTest, MapsErrnoToErrorCode) {
    EXPECT_EQ(codeOf(ENOENT), ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(codeOf(EACCES), ErrorCode::ACCESS_VIOLATION);
    EXPECT_EQ(codeOf(EPERM), ErrorCode::ACCESS_VIOLATION);
    EXPECT_EQ(codeOf(EEXIST), ErrorCode::FILE_ALREADY_EXISTS);
    EXPECT_EQ(codeOf(ENOSPC), ErrorCode::DISK_FULL);
    EXPECT_EQ(codeOf(EINVAL), ErrorCode::NOT_DEFINED);
}

TEST(ExceptionsTest, FilesystemErrorIsMapped) {
    std::filesystem::filesystem_error error("open", std::make_error_code(std::errc::permission_denied));
    EXPECT_EQ(toTransferError(error).code, ErrorCode::ACCESS_VIOLATION);
}

TEST(ExceptionsTest, TransferErrorIsKept) {
    TransferError error(ErrorCode::UNKNOWN_TID, "tid");
    TransferError mapped = toTransferError(error);
    EXPECT_EQ(mapped.code, ErrorCode::UNKNOWN_TID);
    EXPECT_STREQ(mapped.what(), "tid");
}

TEST(ExceptionsTest, OtherErrorsAreNotDefined) {
    TransferError mapped = toTransferError(std::runtime_error("boom"));
    EXPECT_EQ(mapped.code, ErrorCode::NOT_DEFINED);
    EXPECT_STREQ(mapped.what(), "boom");
}
