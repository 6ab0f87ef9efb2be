/**
 * @file common/logger.hpp
 * @brief Header file for logger singleton class
*/

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Singleton class for logging
*/
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Log a message on std::cout
     * @param message The message to log
    */
    void log(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        std::cout << message + "\n";
    }

    /**
     * @brief Log an error message on std::cerr
     * @param message The error message to log
    */
    void error(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        std::cerr << message + "\n";
    }

    /**
     * @brief Log a packet trace on std::cout, only when verbose output is enabled
     * @param message The message to log
    */
    void debug(const std::string& message) {
        if (!verbose) {
            return;
        }
        log(message);
    }

    void setVerbose(bool value) {
        verbose = value;
    }

private:
    // Private constructor to prevent instantiation
    Logger() : verbose(false) {}
    std::mutex mutex;
    std::atomic<bool> verbose;
};

#endif
