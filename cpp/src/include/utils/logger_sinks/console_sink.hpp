#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>

namespace solohub::utils
{

// Writes to stderr; stdout stays free for program output.
class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_log_line(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace solohub::utils
