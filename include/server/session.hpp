/**
 * @file server/session.hpp
 * @brief Header file with declaration for server sessions driving one read or write transfer
*/
#ifndef SESSION_HPP
#define SESSION_HPP

#define STOP_CHECK_INTERVAL_MS 100

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <netinet/in.h>
#include "common/packets.hpp"
#include "common/socket.hpp"
#include "server/config.hpp"
#include "server/handler.hpp"
#include "server/options.hpp"

/**
 * @brief Enum for session states
*/
enum class SessionState {
    INITIAL,
    WAITING_AFTER_OACK,
    WAITING_ACK,
    WAITING_LAST_ACK,
    WAITING_DATA,
    WRQ_END,
    RRQ_END,
    ERROR
};

/**
 * @brief Function for converting session state to string
*/
std::string stateToString(SessionState state);

/**
 * @class ServerSession
 * @brief Base class for one transfer with one client, owns retransmission and timeout handling
 * @note Session uses socket given by the server, all packets are exchanged only through it
*/
class ServerSession {
public:
    ServerSession(UdpSocket& socket, const sockaddr_in& dst_addr, const RequestPacket& request, SynchronizedHandler& handler,
                  std::shared_ptr<const ServerConfig> config, const std::atomic<bool>* stopFlag);
    virtual ~ServerSession() = default;
    ServerSession(const ServerSession&) = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    /**
     * @brief Function for handling session until the transfer is complete
     * @throws PeerError if client sent ERROR packet
     * @throws TransferError if transfer failed, code should be reported to the client
    */
    void handleSession();

    SessionState getState() const { return sessionState; }
    const TransferOptions& getOptions() const { return options; }

protected:
    UdpSocket& socket;
    sockaddr_in dst_addr;
    std::string filename;
    DataMode dataMode;
    RequestOptions requestedOptions;
    SynchronizedHandler& handler;
    std::shared_ptr<const ServerConfig> config;
    const std::atomic<bool>* stopFlag;
    SessionState sessionState;
    TransferOptions options;
    uint16_t blockNumber;
    uint32_t retries;
    std::unique_ptr<Packet> lastPacket;

    /**
     * @brief Function for opening the file, negotiating options and sending first packet
    */
    virtual void start() = 0;
    /**
     * @brief Function to handle packet received from the client
     * @param packet Packet other than ERROR
     * @return true if the transfer moved forward, false if packet was ignored
    */
    virtual bool handlePacket(const Packet& packet) = 0;
    /**
     * @brief Function for cleaning the session
    */
    virtual void exit();

    /**
     * @brief Function for sending packet to the client, packet is kept for retransmission
    */
    void send(std::unique_ptr<Packet> packet);
    /**
     * @brief Function for retransmission of the last packet
    */
    void resend();
    bool finished() const;

private:
    std::vector<char> buffer;
    /**
     * @brief Function for handling expired timeout
     * @throws TransferError when the number of retries is exceeded
    */
    void handleTimeout();
    void rejectUnknownTransferId(const sockaddr_in& from);
};

/**
 * @class ReadSession
 * @brief Session sending a file to the client (RRQ)
*/
class ReadSession : public ServerSession {
public:
    ReadSession(UdpSocket& socket, const sockaddr_in& dst_addr, const RequestPacket& request, SynchronizedHandler& handler,
                std::shared_ptr<const ServerConfig> config, const std::atomic<bool>* stopFlag = nullptr);

protected:
    void start() override;
    bool handlePacket(const Packet& packet) override;

private:
    std::unique_ptr<DataSource> source;
    /**
     * @brief Function for reading data block from data source
     * @return vector of at most block size bytes, shorter only at the end of data
     * @throw TransferError if failed to read from data source
    */
    std::vector<char> readDataBlock();
    void sendNextBlock();
};

/**
 * @class WriteSession
 * @brief Session receiving a file from the client (WRQ)
*/
class WriteSession : public ServerSession {
public:
    WriteSession(UdpSocket& socket, const sockaddr_in& dst_addr, const RequestPacket& request, SynchronizedHandler& handler,
                 std::shared_ptr<const ServerConfig> config, const std::atomic<bool>* stopFlag = nullptr);

protected:
    void start() override;
    bool handlePacket(const Packet& packet) override;
    void exit() override;

private:
    std::unique_ptr<DataSink> sink;
    /**
     * @brief Function for writing data block to data sink
     * @throw TransferError if failed to write
    */
    void writeDataBlock(const std::vector<char>& data);
};

#endif
