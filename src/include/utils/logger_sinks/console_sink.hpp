#pragma once

#include "sink.hpp"
#include <cstdio>

namespace livepreview::utils
{

/// Writes records to stderr, keeping stdout free for command output.
class ConsoleSink : public Sink
{
  public:
    void write(const LogRecord &record) override
    {
        const std::string line = render_line(record);
        std::fwrite(line.data(), 1, line.size(), stderr);
    }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console (stderr)"; }
};

} // namespace livepreview::utils
