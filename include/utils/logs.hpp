#ifndef LOGS_HPP
#define LOGS_HPP

#include <string>

namespace Logs {
    void setVerbose(bool verbose);
    bool isVerbose();
    
    // Mirrors every line, uncolored and timestamped, into an append-mode file.
    // An empty path closes the current file.
    bool setLogFile(const std::string& path);
    
    void info(const std::string& message);
    void success(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void debug(const std::string& message);
}

#endif // LOGS_HPP
