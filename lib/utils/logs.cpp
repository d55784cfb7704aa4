#include "utils/logs.hpp"
#include "utils/colors.hpp"
#include <iostream>
#include <fstream>
#include <mutex>
#include <ctime>

namespace Logs {
    
    static std::mutex logMutex;
    static std::ofstream logFile;
    static bool verboseOutput = false;
    
    static std::string timestamp() {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
        return buffer;
    }
    
    static void emit(std::ostream& out, const std::string& tag, 
                     const std::string& coloredTag, const std::string& message) {
        std::lock_guard<std::mutex> lock(logMutex);
        
        out << coloredTag << message << std::endl;
        
        if (logFile.is_open()) {
            logFile << timestamp() << " " << tag << message << std::endl;
        }
    }
    
    void setVerbose(bool verbose) {
        std::lock_guard<std::mutex> lock(logMutex);
        verboseOutput = verbose;
    }
    
    bool isVerbose() {
        std::lock_guard<std::mutex> lock(logMutex);
        return verboseOutput;
    }
    
    bool setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(logMutex);
        
        if (logFile.is_open()) {
            logFile.close();
        }
        
        if (path.empty()) {
            return true;
        }
        
        logFile.open(path, std::ios::app);
        return logFile.is_open();
    }
    
    void info(const std::string& message) {
        emit(std::cout, "[INFO] ", Colors::cyan("[INFO] "), message);
    }
    
    void success(const std::string& message) {
        emit(std::cout, "[SUCCESS] ", Colors::green("[SUCCESS] "), message);
    }
    
    void warning(const std::string& message) {
        emit(std::cout, "[WARNING] ", Colors::yellow("[WARNING] "), message);
    }
    
    void error(const std::string& message) {
        emit(std::cerr, "[ERROR] ", Colors::red("[ERROR] "), message);
    }
    
    void fatal(const std::string& message) {
        emit(std::cerr, "[FATAL] ", Colors::bold(Colors::red("[FATAL] ")), message);
    }
    
    void debug(const std::string& message) {
        if (!isVerbose()) {
            return;
        }
        emit(std::cout, "[DEBUG] ", Colors::blue("[DEBUG] "), message);
    }
}
