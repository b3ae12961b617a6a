#pragma once
#include <cstddef>
#include <string>

// Sink for progress and status events emitted while loading and building.
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void message(const std::string& text) = 0;
    // stage is a short label ("cleaning", "building"); done <= total
    virtual void progress(const std::string& stage, size_t done, size_t total) = 0;
};

class NullReporter : public Reporter {
public:
    void message(const std::string&) override {}
    void progress(const std::string&, size_t, size_t) override {}

    static NullReporter& instance() {
        static NullReporter r;
        return r;
    }
};
