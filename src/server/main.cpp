/**
 * @file server/main.cpp
 * @brief Entrypoint for TFTP server
*/
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <getopt.h>
#include "server/tftp_server.hpp"
#include "server/dir_handler.hpp"
#include "server/config.hpp"
#include "common/socket.hpp"
#include "common/logger.hpp"

/**
 * @brief Flag for handling SIGINT on server
*/
static std::shared_ptr<std::atomic<bool>> stopFlagServer = std::make_shared<std::atomic<bool>>(false);

/**
 * Signal handler for SIGINT
 * @param signal The signal number
*/
void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        stopFlagServer->store(true);
    }
}

enum LongOnlyOption {
    IGNORE_CLIENT_TIMEOUT = 256,
    IGNORE_CLIENT_BLKSIZE,
    READ_ONLY,
    WRITE_ONLY
};

// Define the long options
static struct option long_options[] = {
    {"port", required_argument, 0, 'p'},
    {"address", required_argument, 0, 'a'},
    {"timeout", required_argument, 0, 't'},
    {"blksize-limit", required_argument, 0, 'b'},
    {"retries", required_argument, 0, 'r'},
    {"ignore-client-timeout", no_argument, 0, IGNORE_CLIENT_TIMEOUT},
    {"ignore-client-blksize", no_argument, 0, IGNORE_CLIENT_BLKSIZE},
    {"read-only", no_argument, 0, READ_ONLY},
    {"write-only", no_argument, 0, WRITE_ONLY},
    {"verbose", no_argument, 0, 'v'},
    {0, 0, 0, 0} // End of array need to be filled with 0s
};

static void printUsage(const std::string& program) {
    Logger::instance().log("Usage: " + program + " [-p port] [-a address] [-t timeout] [-b blksize_limit] [-r retries]\n"
                           "       [--ignore-client-timeout] [--ignore-client-blksize] [--read-only | --write-only] [-v] root_dirpath");
}

/**
 * Function for parsing numeric argument
 * @return true if value is a number between min and max
*/
static bool parseNumber(const char* text, long min, long max, long& value) {
    try {
        size_t position = 0;
        value = std::stol(text, &position);
        if (text[position] != '\0') {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return value >= min && value <= max;
}

/**
 * Entrypoint for TFTP Server
 * @param argc The number of arguments
 * @param argv The arguments
 * @return 0 if successful, 1 otherwise
*/
int main(int argc, char* argv[]) {
    long port = 69;
    std::string address = "0.0.0.0";
    std::string root_dirpath;
    ServerConfig config;
    DirHandlerMode mode = DirHandlerMode::READ_WRITE;
    int option_index = 0;
    int option;
    long value;

    while ((option = getopt_long(argc, argv, "p:a:t:b:r:v", long_options, &option_index)) != -1) {
        switch (option) {
            case 'p':
                if (!parseNumber(optarg, 1, 65535, port)) {
                    Logger::instance().log("Invalid port number. Port should be between 1 and 65535.");
                    printUsage(argv[0]);
                    return 1;
                }
                break;
            case 'a':
                address = optarg;
                break;
            case 't':
                if (!parseNumber(optarg, 1, 255, value)) {
                    Logger::instance().log("Invalid timeout. Timeout should be between 1 and 255 seconds.");
                    printUsage(argv[0]);
                    return 1;
                }
                config.timeout = std::chrono::seconds(value);
                break;
            case 'b':
                if (!parseNumber(optarg, MIN_BLOCK_SIZE, MAX_BLOCK_SIZE, value)) {
                    Logger::instance().log("Invalid block size limit. Limit should be between " + std::to_string(MIN_BLOCK_SIZE) +
                                           " and " + std::to_string(MAX_BLOCK_SIZE) + ".");
                    printUsage(argv[0]);
                    return 1;
                }
                config.blockSizeLimit = static_cast<uint16_t>(value);
                break;
            case 'r':
                if (!parseNumber(optarg, 0, 1000000, value)) {
                    Logger::instance().log("Invalid number of retries.");
                    printUsage(argv[0]);
                    return 1;
                }
                config.maxSendRetries = static_cast<uint32_t>(value);
                break;
            case IGNORE_CLIENT_TIMEOUT:
                config.ignoreClientTimeout = true;
                break;
            case IGNORE_CLIENT_BLKSIZE:
                config.ignoreClientBlockSize = true;
                break;
            case READ_ONLY:
                mode = DirHandlerMode::READ_ONLY;
                break;
            case WRITE_ONLY:
                mode = DirHandlerMode::WRITE_ONLY;
                break;
            case 'v':
                Logger::instance().setVerbose(true);
                break;
            case '?': // Option not recognized
                printUsage(argv[0]);
                return 1;
            default:
                break;
        }
    }

    // The root directory path is not optional and should not be a flag-based argument
    // It should be the last argument after the options
    if (optind < argc) {
        root_dirpath = argv[optind];
        Logger::instance().log("Root directory path: " + root_dirpath);
    } else {
        Logger::instance().log("Root directory path is not specified.");
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // Initialize and start the TFTP server
    try {
        auto handler = std::make_shared<DirHandler>(root_dirpath, mode);
        TFTPServer tftpServer(makeAddress(address, static_cast<uint16_t>(port)), handler, config, stopFlagServer);
        tftpServer.start();
    } catch (const std::exception& e) {
        Logger::instance().error("TFTP server failed: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
