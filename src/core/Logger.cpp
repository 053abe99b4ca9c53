/* @file Logger.cpp
 * @brief per-run CSV log of cover transitions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <sstream>
#include <stdexcept>
#include <utility>

// Elero headers
#include "core/Logger.hpp"

using namespace elero::core;

namespace {
  // quote fields that would break the row (status texts contain spaces, labels a slash)
  std::string csvField(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos)
      return text;
    std::string out = "\"";
    for (char ch : text) {
      if (ch == '"')
        out += '"';
      out += ch;
    }
    out += '"';
    return out;
  }
} // namespace

Logger::Logger(std::shared_ptr<const Clock> clock) : clock_(std::move(clock)) {
  if (!clock_)
    throw std::invalid_argument("[Logger] clock is nullptr");
}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& path) {
  finishRun();
  if (!csvFile_.open(path))
    return false;
  csvFile_.write("elapsed_s,unit,event,state,position\n");
  runStart_ = clock_->now();
  running_ = true;
  return true;
}

void Logger::log(const LogEvent& event) {
  if (!running_)
    return;

  std::ostringstream row;
  row << Seconds(clock_->now() - runStart_).count() << ',' << csvField(event.unit) << ','
      << csvField(event.event) << ',' << csvField(event.state) << ',';
  if (event.position)
    row << *event.position;
  row << '\n';
  csvFile_.write(row.str());
}

void Logger::finishRun() {
  if (!running_)
    return;
  running_ = false;
  csvFile_.close();
}
