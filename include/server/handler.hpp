/**
 * @file server/handler.hpp
 * @brief Header file with interfaces through which transfers read and store file content
*/
#ifndef HANDLER_HPP
#define HANDLER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <netinet/in.h>

/**
 * @class DataSource
 * @brief Stream of bytes sent to client by read transfer
*/
class DataSource {
public:
    virtual ~DataSource() = default;
    /**
     * @brief Read at most size bytes into buffer
     * @return number of bytes read, 0 at the end of data
     * @throws any std::exception on read failure
    */
    virtual size_t read(char* buffer, size_t size) = 0;
};

/**
 * @class DataSink
 * @brief Destination of bytes received from client by write transfer
*/
class DataSink {
public:
    virtual ~DataSink() = default;
    /**
     * @brief Store one block of data
     * @throws any std::exception on write failure
    */
    virtual void write(const char* data, size_t size) = 0;
    /**
     * @brief Called once after the last block was written
    */
    virtual void finish() {}
    /**
     * @brief Called when the transfer failed after the sink was opened
    */
    virtual void abort() {}
};

/**
 * @class TransferHandler
 * @brief Opens data sources and sinks for incoming requests
 * @note Calls are serialized by the server, implementation does not need its own locking
 * @note Errors are reported by throwing, TransferError selects the error code sent to the client
*/
class TransferHandler {
public:
    virtual ~TransferHandler() = default;
    /**
     * @brief Open file for read request
     * @param peer Address of the client
     * @param filename Requested filename
     * @return data source and its size if known
    */
    virtual std::pair<std::unique_ptr<DataSource>, std::optional<uint64_t>> openForRead(const sockaddr_in& peer, const std::string& filename) = 0;
    /**
     * @brief Open file for write request
     * @param peer Address of the client
     * @param filename Requested filename
     * @param declaredSize Value of tsize option if the client sent one
     * @return data sink
    */
    virtual std::unique_ptr<DataSink> openForWrite(const sockaddr_in& peer, const std::string& filename, std::optional<uint64_t> declaredSize) = 0;
};

/**
 * @class SynchronizedHandler
 * @brief Wrapper shared by all transfers, lock is held only for the duration of one open call
 * @note Exceptions thrown by the handler are translated into TransferError
*/
class SynchronizedHandler {
public:
    explicit SynchronizedHandler(std::shared_ptr<TransferHandler> handler);
    std::pair<std::unique_ptr<DataSource>, std::optional<uint64_t>> openForRead(const sockaddr_in& peer, const std::string& filename);
    std::unique_ptr<DataSink> openForWrite(const sockaddr_in& peer, const std::string& filename, std::optional<uint64_t> declaredSize);

private:
    std::shared_ptr<TransferHandler> handler;
    std::mutex mutex;
};

#endif
