/**
 * @file server/tftp_server.hpp
 * @brief Header file with declaration for TFTP server class and its methods and attributes
*/
#ifndef TFTPSERVER_HPP
#define TFTPSERVER_HPP

#define LISTEN_TIMEOUT_MS 100

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include <netinet/in.h>
#include "common/packets.hpp"
#include "common/socket.hpp"
#include "server/config.hpp"
#include "server/handler.hpp"
#include "server/registry.hpp"

/**
 * @class TFTPServer
 * @brief Receives requests on the listening socket and runs every accepted transfer in its own task
*/
class TFTPServer {
public:
    /**
     * @brief TFTPServer constructor which binds listening socket
     * @param listenAddr The address to listen on, port 0 lets OS choose the port
     * @param handler Handler opening files for transfers
     * @param config Transfer policy shared by all transfers
     * @param stopFlag Flag which stops the server when set, a new one is created when null
     * @throws std::runtime_error if socket can not be bound
    */
    TFTPServer(const sockaddr_in& listenAddr, std::shared_ptr<TransferHandler> handler, const ServerConfig& config = ServerConfig(),
               std::shared_ptr<std::atomic<bool>> stopFlag = nullptr);
    ~TFTPServer();
    TFTPServer(const TFTPServer&) = delete;
    TFTPServer& operator=(const TFTPServer&) = delete;

    /**
     * @brief method for start main loop of server and receive new clients
     * Returns after stop() was called, all running transfers are finished by then
     * @throws std::runtime_error on error of the listening socket
    */
    void start();
    /**
     * @brief method for requesting stop of the main loop, safe to call from any thread
    */
    void stop();
    /**
     * @brief method for waiting until all client sessions terminate
    */
    void shutDown();

    sockaddr_in listenAddress() const;
    /**
     * @brief number of clients with transfer in progress
    */
    size_t inFlight() const;

private:
    UdpSocket listenSocket;
    sockaddr_in localAddr;
    std::shared_ptr<const ServerConfig> config;
    SynchronizedHandler handler;
    RequestRegistry registry;
    std::shared_ptr<std::atomic<bool>> stopFlag;
    std::vector<std::future<void>> clientFutures;

    /**
     * @brief method to handle new packet on listening socket, if it is a new request it starts new client session
     * @param clientAddr The address of client
     * @param buffer The buffer received from socket
     * @param bufferSize The size of buffer
    */
    void handleClientRequest(const sockaddr_in& clientAddr, const char* buffer, size_t bufferSize);
    /**
     * @brief method running in its own task, binds transfer socket and runs the session
    */
    void handleTransfer(sockaddr_in clientAddr, std::shared_ptr<const RequestPacket> request);
    void runSession(UdpSocket& transferSocket, const sockaddr_in& clientAddr, const RequestPacket& request);
    void sendError(UdpSocket& transferSocket, const sockaddr_in& clientAddr, const ErrorPacket& errorPacket);
};

#endif
