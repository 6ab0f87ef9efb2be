/**
 * @file server/session.cpp
 * @brief Implementation of read and write transfer sessions
*/
#include "server/session.hpp"
#include "common/exceptions.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

std::string stateToString(SessionState state) {
    switch (state) {
        case SessionState::INITIAL: return "INITIAL";
        case SessionState::WAITING_AFTER_OACK: return "WAITING_AFTER_OACK";
        case SessionState::WAITING_ACK: return "WAITING_ACK";
        case SessionState::WAITING_LAST_ACK: return "WAITING_LAST_ACK";
        case SessionState::WAITING_DATA: return "WAITING_DATA";
        case SessionState::WRQ_END: return "WRQ_END";
        case SessionState::RRQ_END: return "RRQ_END";
        case SessionState::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

ServerSession::ServerSession(UdpSocket& socket, const sockaddr_in& dst_addr, const RequestPacket& request, SynchronizedHandler& handler,
                             std::shared_ptr<const ServerConfig> config, const std::atomic<bool>* stopFlag)
    : socket(socket),
      dst_addr(dst_addr),
      filename(request.filename),
      dataMode(request.mode),
      requestedOptions(request.options),
      handler(handler),
      config(std::move(config)),
      stopFlag(stopFlag),
      sessionState(SessionState::INITIAL),
      blockNumber(0),
      retries(0),
      lastPacket(nullptr),
      buffer(BUFFER_SIZE) {
    options.timeout = this->config->timeout;
}

void ServerSession::handleSession() {
    using clock = std::chrono::steady_clock;
    try {
        start();

        clock::time_point deadline = clock::now() + options.timeout;
        while (!finished()) {
            // SIGINT termination
            if (stopFlag != nullptr && stopFlag->load()) {
                throw TransferError(ErrorCode::NOT_DEFINED, "Server shutdown");
            }

            clock::time_point now = clock::now();
            if (now >= deadline) {
                handleTimeout();
                deadline = clock::now() + options.timeout;
                continue;
            }

            auto wait = std::min(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now),
                                 std::chrono::milliseconds(STOP_CHECK_INTERVAL_MS));
            sockaddr_in from;
            std::optional<size_t> receivedBytes = socket.receiveFrom(buffer.data(), buffer.size(), from, wait);
            if (!receivedBytes) {
                continue;
            }

            // Check if the TID matches
            if (!sameAddress(from, dst_addr)) {
                rejectUnknownTransferId(from);
                continue;
            }

            // Malformed packets are dropped, client will retransmit
            std::unique_ptr<Packet> packet;
            try {
                packet = Packet::parse(buffer.data(), *receivedBytes);
            } catch (const ParsingError& e) {
                Logger::instance().debug("Ignoring malformed packet from " + addressToString(from) + ": " + e.what());
                continue;
            } catch (const OptionError& e) {
                Logger::instance().debug("Ignoring malformed packet from " + addressToString(from) + ": " + e.what());
                continue;
            }
            Logger::instance().debug(packet->describe(from));

            if (packet->getOpcode() == Opcode::ERROR) {
                const auto& errorPacket = static_cast<const ErrorPacket&>(*packet);
                throw PeerError(errorPacket.errorCode, "Client sent error: " + errorPacket.errorMessage);
            }

            if (handlePacket(*packet)) {
                // Reset the number of retries
                retries = 0;
                deadline = clock::now() + options.timeout;
            }
        }
    } catch (const std::exception&) {
        sessionState = SessionState::ERROR;
        exit();
        throw;
    }
    exit();
}

bool ServerSession::finished() const {
    return sessionState == SessionState::RRQ_END || sessionState == SessionState::WRQ_END || sessionState == SessionState::ERROR;
}

void ServerSession::send(std::unique_ptr<Packet> packet) {
    Logger::instance().debug("=> " + packet->describe(dst_addr));
    socket.sendTo(packet->serialize(), dst_addr);
    lastPacket = std::move(packet);
}

void ServerSession::resend() {
    if (!lastPacket) {
        return;
    }
    Logger::instance().debug("=> " + lastPacket->describe(dst_addr));
    socket.sendTo(lastPacket->serialize(), dst_addr);
}

void ServerSession::handleTimeout() {
    // Check if the number of retries is exceeded
    if (retries >= config->maxSendRetries) {
        Logger::instance().log("Max retries reached for " + addressToString(dst_addr) + ", giving up.");
        throw TransferError(ErrorCode::NOT_DEFINED, "Transfer timed out");
    }
    ++retries;
    Logger::instance().debug("Timeout, retransmitting to " + addressToString(dst_addr) + " (attempt " + std::to_string(retries) + ").");
    resend();
}

void ServerSession::rejectUnknownTransferId(const sockaddr_in& from) {
    ErrorPacket errorPacket(ErrorCode::UNKNOWN_TID, "Unknown transfer ID");
    Logger::instance().debug("=> " + errorPacket.describe(from));
    try {
        socket.sendTo(errorPacket.serialize(), from);
    } catch (const std::runtime_error& e) {
        Logger::instance().error(std::string("Failed to send error to ") + addressToString(from) + ": " + e.what());
    }
}

void ServerSession::exit() {
    Logger::instance().debug("Exiting server session with " + addressToString(dst_addr) + " in state " + stateToString(sessionState));
}

// READ SESSION
ReadSession::ReadSession(UdpSocket& socket, const sockaddr_in& dst_addr, const RequestPacket& request, SynchronizedHandler& handler,
                         std::shared_ptr<const ServerConfig> config, const std::atomic<bool>* stopFlag)
    : ServerSession(socket, dst_addr, request, handler, std::move(config), stopFlag) {}

void ReadSession::start() {
    auto opened = handler.openForRead(dst_addr, filename);
    source = std::move(opened.first);
    options = negotiateOptions(requestedOptions, *config, SessionType::READ, opened.second);

    Logger::instance().log("Sending \"" + filename + "\" to " + addressToString(dst_addr) + " in " + modeToString(dataMode) + " mode");
    if (options.oackRequired) {
        // DATA follows after client acknowledges OACK with ACK 0
        blockNumber = 0;
        send(std::make_unique<OACKPacket>(options.oack));
        sessionState = SessionState::WAITING_AFTER_OACK;
    } else {
        sendNextBlock();
    }
}

std::vector<char> ReadSession::readDataBlock() {
    std::vector<char> data(options.blockSize);
    size_t filled = 0;
    try {
        while (filled < data.size()) {
            size_t bytesRead = source->read(data.data() + filled, data.size() - filled);
            if (bytesRead == 0) {
                break;
            }
            filled += bytesRead;
        }
    } catch (const std::exception& e) {
        throw toTransferError(e);
    }
    data.resize(filled);
    return data;
}

void ReadSession::sendNextBlock() {
    std::vector<char> data = readDataBlock();
    bool lastBlock = data.size() < options.blockSize;
    ++blockNumber;
    send(std::make_unique<DataPacket>(blockNumber, data));
    sessionState = lastBlock ? SessionState::WAITING_LAST_ACK : SessionState::WAITING_ACK;
}

bool ReadSession::handlePacket(const Packet& packet) {
    if (packet.getOpcode() != Opcode::ACK) {
        return false;
    }
    const auto& ack = static_cast<const ACKPacket&>(packet);

    // Duplicated or delayed ACK
    if (ack.blockNumber != blockNumber) {
        return false;
    }

    switch (sessionState) {
        case SessionState::WAITING_AFTER_OACK:
        case SessionState::WAITING_ACK:
            sendNextBlock();
            return true;
        case SessionState::WAITING_LAST_ACK:
            Logger::instance().log("File \"" + filename + "\" sent to " + addressToString(dst_addr));
            sessionState = SessionState::RRQ_END;
            return true;
        default:
            return false;
    }
}

// WRITE SESSION
WriteSession::WriteSession(UdpSocket& socket, const sockaddr_in& dst_addr, const RequestPacket& request, SynchronizedHandler& handler,
                           std::shared_ptr<const ServerConfig> config, const std::atomic<bool>* stopFlag)
    : ServerSession(socket, dst_addr, request, handler, std::move(config), stopFlag) {}

void WriteSession::start() {
    options = negotiateOptions(requestedOptions, *config, SessionType::WRITE, std::nullopt);
    sink = handler.openForWrite(dst_addr, filename, options.transferSize);

    Logger::instance().log("Receiving \"" + filename + "\" from " + addressToString(dst_addr) + " in " + modeToString(dataMode) + " mode");
    // OACK acknowledges the request itself, client continues with DATA 1
    if (options.oackRequired) {
        send(std::make_unique<OACKPacket>(options.oack));
    } else {
        send(std::make_unique<ACKPacket>(0));
    }
    blockNumber = 1;
    sessionState = SessionState::WAITING_DATA;
}

void WriteSession::writeDataBlock(const std::vector<char>& data) {
    if (data.empty()) {
        return;
    }
    try {
        sink->write(data.data(), data.size());
    } catch (const TransferError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransferError(ErrorCode::DISK_FULL, std::string("Disk full or allocation exceeded: ") + e.what());
    }
}

bool WriteSession::handlePacket(const Packet& packet) {
    if (packet.getOpcode() != Opcode::DATA) {
        return false;
    }
    const auto& dataPacket = static_cast<const DataPacket&>(packet);

    if (dataPacket.blockNumber != blockNumber) {
        // Client missed our ACK and sent the previous block again
        if (static_cast<int16_t>(dataPacket.blockNumber - blockNumber) < 0) {
            resend();
        }
        return false;
    }

    if (dataPacket.data.size() > options.blockSize) {
        throw TransferError(ErrorCode::ILLEGAL_OPERATION, "Illegal TFTP operation");
    }

    writeDataBlock(dataPacket.data);

    if (dataPacket.data.size() < options.blockSize) {
        try {
            sink->finish();
        } catch (const TransferError&) {
            throw;
        } catch (const std::exception& e) {
            throw TransferError(ErrorCode::DISK_FULL, std::string("Disk full or allocation exceeded: ") + e.what());
        }
        send(std::make_unique<ACKPacket>(blockNumber));
        sessionState = SessionState::WRQ_END;
        Logger::instance().log("File \"" + filename + "\" received from " + addressToString(dst_addr));
        return true;
    }

    send(std::make_unique<ACKPacket>(blockNumber));
    ++blockNumber;
    return true;
}

void WriteSession::exit() {
    if (sessionState == SessionState::ERROR && sink) {
        sink->abort();
    }
    ServerSession::exit();
}
