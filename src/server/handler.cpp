/**
 * @file server/handler.cpp
 * @brief Implementation of synchronized access to transfer handler
*/
#include "server/handler.hpp"
#include "common/exceptions.hpp"
#include <stdexcept>

SynchronizedHandler::SynchronizedHandler(std::shared_ptr<TransferHandler> handler)
    : handler(std::move(handler)) {
    if (!this->handler) {
        throw std::invalid_argument("Transfer handler must not be null");
    }
}

std::pair<std::unique_ptr<DataSource>, std::optional<uint64_t>> SynchronizedHandler::openForRead(const sockaddr_in& peer, const std::string& filename) {
    std::pair<std::unique_ptr<DataSource>, std::optional<uint64_t>> result;
    try {
        std::lock_guard<std::mutex> lock(mutex);
        result = handler->openForRead(peer, filename);
    } catch (const std::exception& e) {
        throw toTransferError(e);
    }
    if (!result.first) {
        throw TransferError(ErrorCode::NOT_DEFINED, "No data source for " + filename);
    }
    return result;
}

std::unique_ptr<DataSink> SynchronizedHandler::openForWrite(const sockaddr_in& peer, const std::string& filename, std::optional<uint64_t> declaredSize) {
    std::unique_ptr<DataSink> sink;
    try {
        std::lock_guard<std::mutex> lock(mutex);
        sink = handler->openForWrite(peer, filename, declaredSize);
    } catch (const std::exception& e) {
        throw toTransferError(e);
    }
    if (!sink) {
        throw TransferError(ErrorCode::NOT_DEFINED, "No data sink for " + filename);
    }
    return sink;
}
