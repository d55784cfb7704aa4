#ifndef FALLBACK_CHAIN_HPP
#define FALLBACK_CHAIN_HPP

#include "lib/media_types.hpp"
#include "lib/progress.hpp"
#include <functional>
#include <string>
#include <vector>

namespace Fallback {
    
    struct Method {
        std::string name;
        std::function<bool()> precondition;     // empty means always applicable
        std::function<Media::Result()> action;
    };
    
    class FallbackChain {
    private:
        std::string goal;
        std::vector<Method> methods;
        std::vector<std::string> diagnostics;
        std::vector<std::string> skipped;
        size_t attemptCount;
        
    public:
        FallbackChain(const std::string& chainGoal, std::vector<Method> chainMethods);
        
        // Runs methods in order until one succeeds. One progress update per
        // attempted method; skipped methods are not attempts.
        Media::Result run(Progress::Reporter& progress);
        
        size_t attempts() const { return attemptCount; }
        const std::vector<std::string>& failures() const { return diagnostics; }
        const std::vector<std::string>& skippedMethods() const { return skipped; }
    };
    
    Media::Result runChain(const std::string& goal, std::vector<Method> methods, 
                           Progress::Reporter& progress);
}

#endif // FALLBACK_CHAIN_HPP
