#pragma once

#include <ostream>
#include <string>

namespace clicore {

/// Destination for everything the core prints: help, diagnostics, command output.
class IOutputSink {
public:
    virtual ~IOutputSink() = default;
    virtual void writeLine(const std::string& line) = 0;
    virtual void writeError(const std::string& line) = 0;
};

/// Writes lines to a pair of streams; the streams must outlive the sink.
class StreamOutputSink : public IOutputSink {
public:
    StreamOutputSink(std::ostream& out, std::ostream& err);
    void writeLine(const std::string& line) override;
    void writeError(const std::string& line) override;

private:
    std::ostream& out;
    std::ostream& err;
};

/// stdout / stderr.
class ConsoleOutputSink : public StreamOutputSink {
public:
    ConsoleOutputSink();
};

}
