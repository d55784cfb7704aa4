#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include "lib/config.hpp"
#include "lib/media_types.hpp"
#include "lib/platform/strategy.hpp"
#include "lib/progress.hpp"
#include "utils/process.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace Pipeline {
    
    struct Request {
        Media::Device device;
        std::string image;
        Media::ImageMetadata metadata;
        Media::FormatSpec format;
        Media::BootSpec boot;
        bool extractFiles = true;
    };
    
    // Formatting -> Deploying -> InstallingBoot. Cancellation is honoured
    // only between stages; nothing escapes run() as an exception.
    class Orchestrator {
    private:
        Platform::PlatformStrategy& strategy;
        Process::ToolRunner& runner;
        Settings::Config config;
        Progress::Sink sink;
        
    public:
        Orchestrator(Platform::PlatformStrategy& platformStrategy, Process::ToolRunner& toolRunner,
                     const Settings::Config& settings, Progress::Sink eventSink);
        
        Media::PipelineResult run(Request& request, const std::atomic<bool>& cancelRequested);
        
    private:
        Media::Result installBoot(const Media::Device& device, const Media::BootSpec& boot,
                                  Progress::Reporter& progress);
    };
    
    // Runs one request on a dedicated thread
    class Worker {
    private:
        Orchestrator& orchestrator;
        Request request;
        std::atomic<bool> cancelRequested;
        std::atomic<bool> done;
        std::thread thread;
        std::mutex resultMutex;
        Media::PipelineResult result;
        
    public:
        Worker(Orchestrator& pipeline, Request work);
        ~Worker();
        
        Worker(const Worker&) = delete;
        Worker& operator=(const Worker&) = delete;
        
        void start();
        void cancel();
        bool cancelled() const;
        bool finished() const;
        
        // Joins the thread and returns the run's result
        Media::PipelineResult wait();
    };
}

#endif // ORCHESTRATOR_HPP
