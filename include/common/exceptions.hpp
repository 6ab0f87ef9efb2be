/**
 * @file common/exceptions.hpp
 * @brief Header file with declaration for exceptions
*/

#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include "common/packets.hpp"

/**
 * @brief Exception class for errors during parsing of packets
*/
class ParsingError : public std::runtime_error {
public:
    ParsingError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Exception class for errors during option parsing
*/
class OptionError : public std::runtime_error {
public:
    OptionError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Exception which terminates one transfer, carries the error code reported to the peer
*/
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message) : std::runtime_error(message), code(code) {}
    ErrorCode code;
};

/**
 * @brief Transfer aborted by an ERROR packet from the peer, nothing is sent back
*/
class PeerError : public TransferError {
public:
    PeerError(ErrorCode code, const std::string& message) : TransferError(code, message) {}
};

/**
 * @brief Function for translating exception thrown by a data source/sink into a transfer error
 * @param e The exception to translate
 * @return TransferError with the matching wire error code
*/
TransferError toTransferError(const std::exception& e);

#endif // EXCEPTIONS_HPP
