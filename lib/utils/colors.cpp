#include "utils/colors.hpp"
#include <atomic>

namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string RED = "\033[31m";
    const std::string GREEN = "\033[32m";
    const std::string YELLOW = "\033[33m";
    const std::string BLUE = "\033[34m";
    const std::string CYAN = "\033[36m";
    const std::string BOLD = "\033[1m";
    
    static std::atomic<bool> colorsEnabled{true};
    
    void setEnabled(bool enabled) {
        colorsEnabled = enabled;
    }
    
    bool isEnabled() {
        return colorsEnabled;
    }
    
    std::string colorize(const std::string& text, const std::string& color) {
        if (!colorsEnabled) {
            return text;
        }
        return color + text + RESET;
    }
    
    std::string red(const std::string& text) {
        return colorize(text, RED);
    }
    
    std::string green(const std::string& text) {
        return colorize(text, GREEN);
    }
    
    std::string yellow(const std::string& text) {
        return colorize(text, YELLOW);
    }
    
    std::string blue(const std::string& text) {
        return colorize(text, BLUE);
    }
    
    std::string cyan(const std::string& text) {
        return colorize(text, CYAN);
    }
    
    std::string bold(const std::string& text) {
        return colorize(text, BOLD);
    }
}
