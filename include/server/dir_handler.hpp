/**
 * @file server/dir_handler.hpp
 * @brief Header file with declaration for transfer handler serving files from one directory
*/
#ifndef DIR_HANDLER_HPP
#define DIR_HANDLER_HPP

#include <filesystem>
#include <fstream>
#include <string>
#include "server/handler.hpp"

/**
 * @brief Enum for allowed transfer directions
*/
enum class DirHandlerMode {
    READ_WRITE,
    READ_ONLY,
    WRITE_ONLY
};

/**
 * @brief Function for determine if there is enough space for file when tsize is presented in options
 * @param size Size of file
 * @param rootDir Directory on the filesystem which will hold the file
 * @return true if there is enough space, false otherwise
*/
bool hasEnoughSpace(uint64_t size, const std::string& rootDir);

/**
 * @class FileSource
 * @brief Data source reading a file
*/
class FileSource : public DataSource {
public:
    explicit FileSource(const std::filesystem::path& path);
    size_t read(char* buffer, size_t size) override;

private:
    std::ifstream readStream;
};

/**
 * @class FileSink
 * @brief Data sink writing a new file, the file is removed when transfer is aborted
*/
class FileSink : public DataSink {
public:
    explicit FileSink(const std::filesystem::path& path);
    void write(const char* data, size_t size) override;
    void finish() override;
    void abort() override;

private:
    std::filesystem::path path;
    std::ofstream writeStream;
};

/**
 * @class DirHandler
 * @brief Transfer handler which serves files relative to the root directory
 * @note Absolute filenames and filenames containing ".." are refused with access violation
*/
class DirHandler : public TransferHandler {
public:
    /**
     * @brief DirHandler constructor which creates root directory when it does not exist
     * @throws std::runtime_error if root directory can not be created
    */
    DirHandler(const std::string& rootDirPath, DirHandlerMode mode = DirHandlerMode::READ_WRITE);
    std::pair<std::unique_ptr<DataSource>, std::optional<uint64_t>> openForRead(const sockaddr_in& peer, const std::string& filename) override;
    std::unique_ptr<DataSink> openForWrite(const sockaddr_in& peer, const std::string& filename, std::optional<uint64_t> declaredSize) override;

private:
    std::filesystem::path rootDir;
    DirHandlerMode mode;
    std::filesystem::path resolve(const std::string& filename) const;
};

#endif
