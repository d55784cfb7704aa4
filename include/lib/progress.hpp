#ifndef PROGRESS_HPP
#define PROGRESS_HPP

#include "lib/media_types.hpp"
#include <functional>
#include <string>

namespace Progress {
    
    using Sink = std::function<void(const Media::ProgressEvent&)>;
    
    // The root reporter owns the sink and keeps percentages non-decreasing
    // within a stage. A child reporter maps its own 0-100 onto a window of
    // its parent, so nested operations can report from zero.
    class Reporter {
    private:
        Reporter* parent;
        int low;
        int high;
        Sink sink;
        Media::Stage stage;
        int lastPercent;
        
    public:
        explicit Reporter(Sink eventSink);
        Reporter(Reporter& parentReporter, int windowLow, int windowHigh);
        
        void beginStage(Media::Stage newStage, const std::string& message);
        void update(int percent, const std::string& message);
        void finish(Media::Stage finalStage, Media::Terminal terminal, const std::string& message);
        
        int current() const;
        Media::Stage currentStage() const;
        
    private:
        Reporter& root();
        void emit(int percent, const std::string& message, Media::Terminal terminal);
    };
}

#endif // PROGRESS_HPP
