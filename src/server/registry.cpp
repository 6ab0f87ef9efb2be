/**
 * @file server/registry.cpp
 * @brief Implementation of registry of clients with transfer in progress
*/
#include "server/registry.hpp"

RequestRegistry::Key RequestRegistry::keyOf(const sockaddr_in& addr) {
    return {addr.sin_addr.s_addr, addr.sin_port};
}

bool RequestRegistry::insert(const sockaddr_in& addr) {
    std::lock_guard<std::mutex> lock(mutex);
    return peers.insert(keyOf(addr)).second;
}

void RequestRegistry::remove(const sockaddr_in& addr) {
    std::lock_guard<std::mutex> lock(mutex);
    peers.erase(keyOf(addr));
}

bool RequestRegistry::contains(const sockaddr_in& addr) const {
    std::lock_guard<std::mutex> lock(mutex);
    return peers.count(keyOf(addr)) > 0;
}

size_t RequestRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return peers.size();
}
