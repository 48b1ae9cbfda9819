#include "cli/OutputSink.hpp"

#include <iostream>

namespace clicore {

StreamOutputSink::StreamOutputSink(std::ostream& out, std::ostream& err) : out(out), err(err) {}

void StreamOutputSink::writeLine(const std::string& line) { out << line << "\n"; }
void StreamOutputSink::writeError(const std::string& line) { err << line << "\n"; }

ConsoleOutputSink::ConsoleOutputSink() : StreamOutputSink(std::cout, std::cerr) {}

}
