/**
 * @file server/tftp_server.cpp
 * @brief Implementation of TFTP Server
*/
#include "server/tftp_server.hpp"
#include "server/session.hpp"
#include "common/exceptions.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <system_error>

namespace {

/**
 * @brief Removes client from the registry when the transfer task ends, regardless of outcome
*/
class RegistryEntry {
public:
    RegistryEntry(RequestRegistry& registry, const sockaddr_in& addr) : registry(registry), addr(addr) {}
    ~RegistryEntry() { registry.remove(addr); }
    RegistryEntry(const RegistryEntry&) = delete;
    RegistryEntry& operator=(const RegistryEntry&) = delete;

private:
    RequestRegistry& registry;
    sockaddr_in addr;
};

}

TFTPServer::TFTPServer(const sockaddr_in& listenAddr, std::shared_ptr<TransferHandler> handler, const ServerConfig& config,
                       std::shared_ptr<std::atomic<bool>> stopFlag)
    : listenSocket(listenAddr),
      localAddr(listenSocket.localAddress()),
      config(std::make_shared<const ServerConfig>(config)),
      handler(std::move(handler)),
      stopFlag(stopFlag ? std::move(stopFlag) : std::make_shared<std::atomic<bool>>(false)) {
    Logger::instance().log("Starting TFTP server on " + addressToString(localAddr));
}

TFTPServer::~TFTPServer() {
    stop();
    shutDown();
}

void TFTPServer::stop() {
    stopFlag->store(true);
}

void TFTPServer::shutDown() {
    // Wait for all client threads to finish
    for (auto& future : clientFutures) {
        if (future.wait_for(std::chrono::seconds(0)) == std::future_status::timeout) {
            Logger::instance().log("Waiting for client session to terminate...");
        }
        future.wait();
    }

    // Clear the vector of futures
    clientFutures.clear();
}

sockaddr_in TFTPServer::listenAddress() const {
    return localAddr;
}

size_t TFTPServer::inFlight() const {
    return registry.size();
}

void TFTPServer::start() {
    Logger::instance().log("Server listening on " + addressToString(localAddr));

    // Main loop of TFTP Server which is receiving requests from clients
    sockaddr_in clientAddr;
    std::vector<char> buffer(BUFFER_SIZE);
    while (true) {
        // If stop was requested, wait for running transfers and return
        if (stopFlag->load()) {
            Logger::instance().log("Stopping server...");
            shutDown();
            return;
        }

        // Receive initial request from a client, socket errors are fatal
        std::optional<size_t> receivedBytes = listenSocket.receiveFrom(buffer.data(), buffer.size(), clientAddr,
                                                                       std::chrono::milliseconds(LISTEN_TIMEOUT_MS));
        if (receivedBytes) {
            handleClientRequest(clientAddr, buffer.data(), *receivedBytes);
        }

        // Remove finished futures
        clientFutures.erase(std::remove_if(clientFutures.begin(), clientFutures.end(), [](const std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }), clientFutures.end());
    }
}

void TFTPServer::handleClientRequest(const sockaddr_in& clientAddr, const char* buffer, size_t bufferSize) {
    // Invalid packets are not answered
    std::unique_ptr<Packet> packet;
    try {
        packet = Packet::parse(buffer, bufferSize);
    } catch (const ParsingError& e) {
        Logger::instance().debug("Ignoring malformed packet from " + addressToString(clientAddr) + ": " + e.what());
        return;
    } catch (const OptionError& e) {
        Logger::instance().debug("Ignoring malformed packet from " + addressToString(clientAddr) + ": " + e.what());
        return;
    }

    if (packet->getOpcode() != Opcode::RRQ && packet->getOpcode() != Opcode::WRQ) {
        Logger::instance().debug("Ignoring packet which is not a request: " + packet->describe(clientAddr));
        return;
    }
    std::shared_ptr<const RequestPacket> request(static_cast<RequestPacket*>(packet.release()));

    // Client retransmitted request before it received our first reply
    if (!registry.insert(clientAddr)) {
        Logger::instance().debug("Ignoring pending request: " + request->describe(clientAddr));
        return;
    }
    Logger::instance().log(request->describe(clientAddr));

    try {
        clientFutures.push_back(std::async(std::launch::async, &TFTPServer::handleTransfer, this, clientAddr, request));
    } catch (const std::system_error& e) {
        Logger::instance().error("Failed to start transfer for " + addressToString(clientAddr) + ": " + e.what());
        registry.remove(clientAddr);
    }
}

void TFTPServer::handleTransfer(sockaddr_in clientAddr, std::shared_ptr<const RequestPacket> request) {
    RegistryEntry entry(registry, clientAddr);

    // Transfer socket on the same local address, port is chosen by OS
    sockaddr_in transferAddr = localAddr;
    transferAddr.sin_port = 0;

    std::unique_ptr<UdpSocket> transferSocket;
    try {
        transferSocket = std::make_unique<UdpSocket>(transferAddr);
    } catch (const std::runtime_error& e) {
        Logger::instance().error("Failed to open transfer socket for " + addressToString(clientAddr) + ": " + e.what());
        return;
    }

    runSession(*transferSocket, clientAddr, *request);
}

void TFTPServer::runSession(UdpSocket& transferSocket, const sockaddr_in& clientAddr, const RequestPacket& request) {
    std::unique_ptr<ServerSession> session;
    if (request.getOpcode() == Opcode::RRQ) {
        session = std::make_unique<ReadSession>(transferSocket, clientAddr, request, handler, config, stopFlag.get());
    } else {
        session = std::make_unique<WriteSession>(transferSocket, clientAddr, request, handler, config, stopFlag.get());
    }

    try {
        session->handleSession();
    } catch (const PeerError& e) {
        Logger::instance().log("Transfer with " + addressToString(clientAddr) + " aborted: " + e.what());
    } catch (const TransferError& e) {
        Logger::instance().log("Transfer with " + addressToString(clientAddr) + " failed: " + e.what());
        sendError(transferSocket, clientAddr, ErrorPacket(e.code, e.what()));
    } catch (const std::exception& e) {
        Logger::instance().log("Transfer with " + addressToString(clientAddr) + " failed: " + e.what());
        sendError(transferSocket, clientAddr, ErrorPacket(ErrorCode::NOT_DEFINED, e.what()));
    }
}

void TFTPServer::sendError(UdpSocket& transferSocket, const sockaddr_in& clientAddr, const ErrorPacket& errorPacket) {
    Logger::instance().debug("=> " + errorPacket.describe(clientAddr));
    try {
        transferSocket.sendTo(errorPacket.serialize(), clientAddr);
    } catch (const std::runtime_error& e) {
        Logger::instance().error("Failed to send error to " + addressToString(clientAddr) + ": " + e.what());
    }
}
