#include "pipeline/output_sink.h"

#include <iostream>

namespace live_asr {
namespace pipeline {

void StreamSink::write(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << message << '\n';
    out_.flush();
}

StdoutSink::StdoutSink() : StreamSink(std::cout) {}

}  // namespace pipeline
}  // namespace live_asr
