#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace live_asr {
namespace pipeline {

class OutputSink {
   public:
    virtual ~OutputSink() = default;
    virtual void write(const std::string& message) = 0;
};

// One message per line, flushed after each write
class StreamSink : public OutputSink {
   public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(const std::string& message) override;

   private:
    std::ostream& out_;
    std::mutex mutex_;
};

class StdoutSink : public StreamSink {
   public:
    StdoutSink();
};

}  // namespace pipeline
}  // namespace live_asr
