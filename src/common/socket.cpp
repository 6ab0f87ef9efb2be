/**
 * @file common/socket.cpp
 * @brief Implementation of UDP socket wrapper
*/
#include "common/socket.hpp"
#include "common/packets.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <arpa/inet.h>
#include <unistd.h>

sockaddr_in makeAddress(const std::string& ip, uint16_t port) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IPv4 address: " + ip);
    }
    return addr;
}

bool sameAddress(const sockaddr_in& a, const sockaddr_in& b) {
    return a.sin_addr.s_addr == b.sin_addr.s_addr && a.sin_port == b.sin_port;
}

UdpSocket::UdpSocket(const sockaddr_in& bindAddr) {
    sockfd = socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd < 0) {
        throw std::runtime_error("Failed to open socket: " + std::string(strerror(errno)));
    }

    if (bind(sockfd, reinterpret_cast<const sockaddr*>(&bindAddr), sizeof(bindAddr)) < 0) {
        std::string reason = strerror(errno);
        close(sockfd);
        throw std::runtime_error("Failed to bind socket to " + addressToString(bindAddr) + ": " + reason);
    }
}

UdpSocket::~UdpSocket() {
    close(sockfd);
}

sockaddr_in UdpSocket::localAddress() const {
    sockaddr_in addr;
    socklen_t len = sizeof(addr);
    std::memset(&addr, 0, sizeof(addr));
    if (getsockname(sockfd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        throw std::runtime_error("Failed to get socket address: " + std::string(strerror(errno)));
    }
    return addr;
}

void UdpSocket::sendTo(const std::vector<char>& data, const sockaddr_in& addr) {
    ssize_t sentBytes = sendto(sockfd, data.data(), data.size(), 0, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (sentBytes < 0) {
        throw std::runtime_error("Failed to send data: " + std::string(strerror(errno)));
    }
}

void UdpSocket::setTimeout(std::chrono::milliseconds timeout) {
    // zero timeout would block forever
    if (timeout.count() <= 0) {
        timeout = std::chrono::milliseconds(1);
    }
    struct timeval tv;
    tv.tv_sec = timeout.count() / 1000;
    tv.tv_usec = (timeout.count() % 1000) * 1000;
    if (setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        throw std::runtime_error("Failed to set timeout: " + std::string(strerror(errno)));
    }
}

std::optional<size_t> UdpSocket::receiveFrom(char* buffer, size_t size, sockaddr_in& from, std::chrono::milliseconds timeout) {
    setTimeout(timeout);
    socklen_t fromLen = sizeof(from);
    ssize_t receivedBytes = recvfrom(sockfd, buffer, size, 0, reinterpret_cast<sockaddr*>(&from), &fromLen);
    if (receivedBytes < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::nullopt;
        }
        throw std::runtime_error("Failed to receive data: " + std::string(strerror(errno)));
    }
    return static_cast<size_t>(receivedBytes);
}
