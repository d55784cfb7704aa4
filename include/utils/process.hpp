#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

namespace Process {
    
    struct Outcome {
        bool launched = false;
        bool timedOut = false;
        int exitCode = -1;
        std::string output;     // stdout and stderr, interleaved
        
        bool ok() const { return launched && !timedOut && exitCode == 0; }
    };
    
    std::string joinCommand(const std::vector<std::string>& argv);
    
    // One-line diagnostic: "not found", "timed out after Ns" or "exit N: <last output line>"
    std::string summarize(const Outcome& outcome);
    
    class ToolRunner {
    public:
        virtual ~ToolRunner() = default;
        
        virtual Outcome run(const std::vector<std::string>& argv,
                            std::chrono::seconds timeout,
                            const std::string& input = "") = 0;
        
        // Absolute path of an executable on PATH, empty when absent
        virtual std::string which(const std::string& tool) = 0;
    };
    
    class SystemRunner : public ToolRunner {
    public:
        Outcome run(const std::vector<std::string>& argv,
                    std::chrono::seconds timeout,
                    const std::string& input = "") override;
        std::string which(const std::string& tool) override;
    };
}

#endif // PROCESS_HPP
