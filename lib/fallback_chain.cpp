#include "lib/fallback_chain.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"

namespace Fallback {
    
    FallbackChain::FallbackChain(const std::string& chainGoal, std::vector<Method> chainMethods)
        : goal(chainGoal), methods(std::move(chainMethods)), attemptCount(0) {
    }
    
    Media::Result FallbackChain::run(Progress::Reporter& progress) {
        diagnostics.clear();
        skipped.clear();
        attemptCount = 0;
        
        const size_t total = methods.size();
        
        for (size_t i = 0; i < total; i++) {
            const Method& method = methods[i];
            
            bool applicable = true;
            try {
                applicable = !method.precondition || method.precondition();
            } catch (const std::exception& e) {
                Logs::debug(goal + ": precondition of " + method.name + " failed: " + e.what());
                applicable = false;
            }
            
            if (!applicable) {
                Logs::debug(goal + ": skipping " + method.name);
                skipped.push_back(method.name);
                continue;
            }
            
            attemptCount++;
            progress.update(static_cast<int>(i * 100 / total), goal + ": trying " + method.name);
            
            Media::Result result;
            try {
                result = method.action ? method.action() 
                                       : Media::Result::fail("no action");
            } catch (const std::bad_alloc&) {
                throw;
            } catch (const std::exception& e) {
                result = ErrorHandler::toResult(e);
            }
            
            if (result.success) {
                Logs::debug(goal + ": " + method.name + " succeeded");
                if (result.message.empty()) {
                    result.message = goal + " completed with " + method.name;
                }
                return result;
            }
            
            Logs::warning(goal + ": " + method.name + " failed: " + result.message);
            diagnostics.push_back(method.name + ": " + result.message);
        }
        
        std::string message = goal + " failed";
        
        if (attemptCount == 0) {
            message += ": no applicable method";
            if (!skipped.empty()) {
                message += " (skipped ";
                for (size_t i = 0; i < skipped.size(); i++) {
                    if (i > 0) message += ", ";
                    message += skipped[i];
                }
                message += ")";
            }
            return Media::Result::fail(message);
        }
        
        message += ": ";
        for (size_t i = 0; i < diagnostics.size(); i++) {
            if (i > 0) message += "; ";
            message += diagnostics[i];
        }
        return Media::Result::fail(message);
    }
    
    Media::Result runChain(const std::string& goal, std::vector<Method> methods, 
                           Progress::Reporter& progress) {
        FallbackChain chain(goal, std::move(methods));
        return chain.run(progress);
    }
}
