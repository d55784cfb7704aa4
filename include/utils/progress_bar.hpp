#ifndef PROGRESS_BAR_HPP
#define PROGRESS_BAR_HPP

#include <string>
#include <chrono>
#include <cstdint>

class ProgressBar {
private:
    size_t total;
    size_t current;
    int barWidth;
    std::chrono::time_point<std::chrono::steady_clock> startTime;
    std::string label;
    bool active;
    
public:
    ProgressBar(size_t totalSize = 100, const std::string& taskLabel = "Progress");
    void update(size_t currentSize, const std::string& detail = "");
    void finish(bool succeeded = true);
    
    // Starts a fresh bar; an unfinished one is closed first
    void restart(const std::string& taskLabel);
    
    static std::string formatTime(double seconds);
    static std::string formatSize(uint64_t bytes);
};

#endif // PROGRESS_BAR_HPP
