/**
 * @file server/registry.hpp
 * @brief Header file with declaration for registry of clients with transfer in progress
*/
#ifndef REGISTRY_HPP
#define REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <utility>
#include <netinet/in.h>

/**
 * @class RequestRegistry
 * @brief Set of client addresses (IP and port) with a transfer in progress, safe to use from many threads
*/
class RequestRegistry {
public:
    /**
     * @brief Insert client address if it is not present yet
     * @return true if the address was inserted, false if a transfer for it is already running
    */
    bool insert(const sockaddr_in& addr);
    /**
     * @brief Remove client address, does nothing if it is not present
    */
    void remove(const sockaddr_in& addr);
    bool contains(const sockaddr_in& addr) const;
    size_t size() const;

private:
    using Key = std::pair<uint32_t, uint16_t>;
    static Key keyOf(const sockaddr_in& addr);
    mutable std::mutex mutex;
    std::set<Key> peers;
};

#endif
