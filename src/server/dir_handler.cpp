/**
 * @file server/dir_handler.cpp
 * @brief Implementation of transfer handler serving files from one directory
*/
#include "server/dir_handler.hpp"
#include "common/exceptions.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <sys/statvfs.h>

bool hasEnoughSpace(uint64_t size, const std::string& rootDir) {
    struct statvfs stat;
    if (statvfs(rootDir.c_str(), &stat) != 0) {
        // Error occurred getting filesystem stats
        return false;
    }

    uint64_t freeSpace = static_cast<uint64_t>(stat.f_bsize) * stat.f_bavail;
    return freeSpace >= size;
}

// FILE SOURCE
FileSource::FileSource(const std::filesystem::path& path) {
    readStream.open(path, std::ios::binary | std::ios::in);
    if (!readStream.is_open()) {
        throw TransferError(ErrorCode::ACCESS_VIOLATION, "Access violation");
    }
}

size_t FileSource::read(char* buffer, size_t size) {
    readStream.read(buffer, size);
    if (readStream.bad()) {
        throw std::runtime_error("Failed to read data from file");
    }
    return static_cast<size_t>(readStream.gcount());
}

// FILE SINK
FileSink::FileSink(const std::filesystem::path& path) : path(path) {
    writeStream.open(path, std::ios::binary | std::ios::trunc | std::ios::out);
    if (!writeStream.is_open()) {
        throw TransferError(ErrorCode::ACCESS_VIOLATION, "Access violation");
    }
}

void FileSink::write(const char* data, size_t size) {
    writeStream.write(data, size);
    if (writeStream.fail()) {
        throw TransferError(ErrorCode::DISK_FULL, "Disk full or allocation exceeded");
    }
}

void FileSink::finish() {
    writeStream.close();
    if (writeStream.fail()) {
        throw TransferError(ErrorCode::DISK_FULL, "Disk full or allocation exceeded");
    }
}

void FileSink::abort() {
    writeStream.close();
    Logger::instance().log("File was not correctly transfered, deleting file " + path.string());
    std::error_code ec;
    if (!std::filesystem::remove(path, ec)) {
        Logger::instance().error("Failed to delete file " + path.string());
    }
}

// DIR HANDLER
DirHandler::DirHandler(const std::string& rootDirPath, DirHandlerMode mode)
    : rootDir(rootDirPath), mode(mode) {
    std::error_code ec;
    if (!std::filesystem::exists(rootDir, ec)) {
        if (!std::filesystem::create_directories(rootDir, ec)) {
            throw std::runtime_error("Failed to create directory " + rootDirPath + ": " + ec.message());
        }
        Logger::instance().log("Created root directory " + rootDirPath);
    } else if (!std::filesystem::is_directory(rootDir, ec)) {
        throw std::runtime_error(rootDirPath + " is not a directory");
    }
}

std::filesystem::path DirHandler::resolve(const std::string& filename) const {
    std::filesystem::path requested(filename);
    if (requested.is_absolute() || requested.has_root_path()) {
        throw TransferError(ErrorCode::ACCESS_VIOLATION, "Access violation");
    }
    for (const auto& part : requested) {
        if (part == "..") {
            throw TransferError(ErrorCode::ACCESS_VIOLATION, "Access violation");
        }
    }

    // Symbolic links inside root must not lead out of it
    std::error_code ec;
    std::filesystem::path canonicalRoot = std::filesystem::weakly_canonical(rootDir, ec);
    if (ec) {
        throw TransferError(ErrorCode::ACCESS_VIOLATION, "Access violation");
    }
    std::filesystem::path target = std::filesystem::weakly_canonical(rootDir / requested, ec);
    if (ec) {
        throw TransferError(ErrorCode::ACCESS_VIOLATION, "Access violation");
    }
    auto rootEnd = std::find_if(canonicalRoot.begin(), canonicalRoot.end(), [](const std::filesystem::path& part) {
        return part.empty();
    });
    if (std::mismatch(canonicalRoot.begin(), rootEnd, target.begin(), target.end()).first != rootEnd) {
        throw TransferError(ErrorCode::ACCESS_VIOLATION, "Access violation");
    }
    return rootDir / requested;
}

std::pair<std::unique_ptr<DataSource>, std::optional<uint64_t>> DirHandler::openForRead(const sockaddr_in& peer, const std::string& filename) {
    if (mode == DirHandlerMode::WRITE_ONLY) {
        throw TransferError(ErrorCode::ACCESS_VIOLATION, "Reading is not allowed");
    }
    std::filesystem::path path = resolve(filename);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw TransferError(ErrorCode::FILE_NOT_FOUND, "File not found");
    }
    std::optional<uint64_t> size;
    uintmax_t fileSize = std::filesystem::file_size(path, ec);
    if (!ec) {
        size = static_cast<uint64_t>(fileSize);
    }

    Logger::instance().log("Opening file on server for " + addressToString(peer) + ": " + path.string());
    return {std::make_unique<FileSource>(path), size};
}

std::unique_ptr<DataSink> DirHandler::openForWrite(const sockaddr_in& peer, const std::string& filename, std::optional<uint64_t> declaredSize) {
    if (mode == DirHandlerMode::READ_ONLY) {
        throw TransferError(ErrorCode::ACCESS_VIOLATION, "Writing is not allowed");
    }
    std::filesystem::path path = resolve(filename);

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        throw TransferError(ErrorCode::FILE_ALREADY_EXISTS, "File already exists");
    }
    if (declaredSize && !hasEnoughSpace(*declaredSize, rootDir.string())) {
        throw TransferError(ErrorCode::DISK_FULL, "Disk full or allocation exceeded");
    }

    Logger::instance().log("Opening file on server for " + addressToString(peer) + ": " + path.string());
    return std::make_unique<FileSink>(path);
}
