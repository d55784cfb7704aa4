#ifndef MOCK_RUNNER_HPP
#define MOCK_RUNNER_HPP

#include <gmock/gmock.h>

#include "utils/process.hpp"

namespace Process {
    
    class MockToolRunner : public ToolRunner {
    public:
        MOCK_METHOD(Outcome, run, (const std::vector<std::string>& argv, std::chrono::seconds timeout,
                                   const std::string& input), (override));
        MOCK_METHOD(std::string, which, (const std::string& tool), (override));
    };
    
    inline Outcome succeeded(const std::string& output = "") {
        Outcome outcome;
        outcome.launched = true;
        outcome.exitCode = 0;
        outcome.output = output;
        return outcome;
    }
    
    inline Outcome failed(int exitCode, const std::string& output = "") {
        Outcome outcome;
        outcome.launched = true;
        outcome.exitCode = exitCode;
        outcome.output = output;
        return outcome;
    }
}

#endif // MOCK_RUNNER_HPP
