#include "utils/progress_bar.hpp"
#include "utils/colors.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cmath>

static const size_t DETAIL_WIDTH = 40;

ProgressBar::ProgressBar(size_t totalSize, const std::string& taskLabel)
    : total(totalSize), current(0), barWidth(40), label(taskLabel), active(false) {
    startTime = std::chrono::steady_clock::now();
}

void ProgressBar::update(size_t currentSize, const std::string& detail) {
    current = currentSize > total ? total : currentSize;
    active = true;
    
    double progress = total > 0 ? static_cast<double>(current) / total : 0.0;
    int pos = static_cast<int>(barWidth * progress);
    
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - startTime).count();
    double remaining = progress > 0 ? elapsed * (1.0 - progress) / progress : -1;
    
    std::string shown = detail.size() > DETAIL_WIDTH ? detail.substr(0, DETAIL_WIDTH - 3) + "..." : detail;
    shown.resize(DETAIL_WIDTH, ' ');
    
    std::cout << "\r" << Colors::cyan(label) << ": [";
    
    for (int i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << Colors::green("=");
        else if (i == pos) std::cout << Colors::green(">");
        else std::cout << " ";
    }
    
    std::cout << "] " << std::fixed << std::setprecision(1) << std::setw(5) << (progress * 100.0) << "% ";
    std::cout << Colors::yellow("ETA: " + formatTime(remaining)) << " " << shown;
    std::cout.flush();
}

void ProgressBar::finish(bool succeeded) {
    if (!active) {
        return;
    }
    
    if (succeeded) {
        update(total);
    }
    std::cout << std::endl;
    active = false;
    
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - startTime).count();
    if (succeeded) {
        std::cout << Colors::green(label + " completed in " + formatTime(elapsed)) << std::endl;
    }
}

void ProgressBar::restart(const std::string& taskLabel) {
    if (active) {
        std::cout << std::endl;
    }
    
    label = taskLabel;
    current = 0;
    active = false;
    startTime = std::chrono::steady_clock::now();
}

std::string ProgressBar::formatTime(double seconds) {
    if (std::isnan(seconds) || std::isinf(seconds) || seconds < 0) {
        return "--:--";
    }
    
    int mins = static_cast<int>(seconds) / 60;
    int secs = static_cast<int>(seconds) % 60;
    
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << mins << ":" 
        << std::setfill('0') << std::setw(2) << secs;
    return oss.str();
}

std::string ProgressBar::formatSize(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}
