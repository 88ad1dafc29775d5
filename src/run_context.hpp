#pragma once

#include <functional>
#include <string>

// Collaborators consulted at every checkpoint of a run. Both are optional:
// no predicate never stops, no sink discards messages.
struct RunContext {
    std::function<bool()> stop_requested;
    std::function<void(const std::string&)> progress;

    bool should_stop() const { return stop_requested && stop_requested(); }
    void report(const std::string& message) const {
        if (progress) progress(message);
    }
};
