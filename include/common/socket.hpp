/**
 * @file common/socket.hpp
 * @brief Header file with declaration for UDP socket wrapper
*/
#ifndef SOCKET_HPP
#define SOCKET_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <netinet/in.h>

/**
 * @brief Function for building IPv4 address from dotted string and port
 * @throws std::runtime_error if the address is not valid
*/
sockaddr_in makeAddress(const std::string& ip, uint16_t port);

/**
 * @brief Function for comparing both IP address and port of two addresses
*/
bool sameAddress(const sockaddr_in& a, const sockaddr_in& b);

/**
 * @class UdpSocket
 * @brief Owner of one bound datagram socket, socket is closed in destructor
*/
class UdpSocket {
public:
    /**
     * @brief Create socket and bind it to the address, port 0 lets OS choose the port
     * @throws std::runtime_error if socket can not be created or bound
    */
    explicit UdpSocket(const sockaddr_in& bindAddr);
    ~UdpSocket();
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * @brief Address the socket is bound to, with the port assigned by OS
    */
    sockaddr_in localAddress() const;

    /**
     * @brief Send one datagram
     * @throws std::runtime_error if sendto fails
    */
    void sendTo(const std::vector<char>& data, const sockaddr_in& addr);

    /**
     * @brief Receive one datagram, wait at most timeout
     * @param buffer Buffer for the datagram
     * @param size Size of the buffer
     * @param from Filled with the sender address
     * @param timeout Maximum time to wait
     * @return number of received bytes, std::nullopt if nothing arrived in time
     * @throws std::runtime_error on socket error
    */
    std::optional<size_t> receiveFrom(char* buffer, size_t size, sockaddr_in& from, std::chrono::milliseconds timeout);

private:
    int sockfd;
    /**
     * @brief Function for setting receive timeout on socket
    */
    void setTimeout(std::chrono::milliseconds timeout);
};

#endif
