#include "lib/progress.hpp"
#include <algorithm>

namespace Progress {
    
    static int clampPercent(int percent) {
        return std::max(0, std::min(100, percent));
    }
    
    Reporter::Reporter(Sink eventSink)
        : parent(nullptr), low(0), high(100), sink(std::move(eventSink)),
          stage(Media::Stage::IDLE), lastPercent(0) {
    }
    
    Reporter::Reporter(Reporter& parentReporter, int windowLow, int windowHigh)
        : parent(&parentReporter), low(clampPercent(windowLow)),
          high(std::max(clampPercent(windowLow), clampPercent(windowHigh))),
          stage(Media::Stage::IDLE), lastPercent(0) {
    }
    
    Reporter& Reporter::root() {
        Reporter* node = this;
        while (node->parent) {
            node = node->parent;
        }
        return *node;
    }
    
    void Reporter::beginStage(Media::Stage newStage, const std::string& message) {
        Reporter& top = root();
        top.stage = newStage;
        top.lastPercent = 0;
        top.emit(0, message, Media::Terminal::NONE);
    }
    
    void Reporter::update(int percent, const std::string& message) {
        int local = clampPercent(percent);
        
        if (parent) {
            int mapped = low + (high - low) * local / 100;
            parent->update(mapped, message);
            return;
        }
        
        lastPercent = std::max(lastPercent, local);
        emit(lastPercent, message, Media::Terminal::NONE);
    }
    
    void Reporter::finish(Media::Stage finalStage, Media::Terminal terminal, const std::string& message) {
        Reporter& top = root();
        top.stage = finalStage;
        if (terminal == Media::Terminal::SUCCESS) {
            top.lastPercent = 100;
        }
        top.emit(top.lastPercent, message, terminal);
    }
    
    int Reporter::current() const {
        const Reporter* node = this;
        while (node->parent) {
            node = node->parent;
        }
        return node->lastPercent;
    }
    
    Media::Stage Reporter::currentStage() const {
        const Reporter* node = this;
        while (node->parent) {
            node = node->parent;
        }
        return node->stage;
    }
    
    void Reporter::emit(int percent, const std::string& message, Media::Terminal terminal) {
        if (!sink) {
            return;
        }
        
        Media::ProgressEvent event;
        event.stage = stage;
        event.percent = percent;
        event.message = message;
        event.terminal = terminal;
        sink(event);
    }
}
