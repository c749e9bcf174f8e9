#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

#include "customio/color_printer.hpp"

namespace customio {

// Terminal-facing output shared by the runner, the steps and the git client.
// Writes are serialized so concurrent repository pulls do not interleave
// their lines. When silent, nothing reaches the stream.
class ConsoleOutput {
  ColorPrinter printer_;
  std::ostream &stream_;
  std::ostringstream sink_;
  bool silent_{false};
  std::mutex mutex_;

public:
  ConsoleOutput() : printer_(std::cout), stream_(std::cout) {}

  ConsoleOutput(std::ostream &os, bool enable_colors)
      : printer_(os, enable_colors), stream_(os) {}

  void set_silent(bool silent) { silent_ = silent; }
  bool silent() const { return silent_; }

  ColorPrinter &printer() { return printer_; }

  void separator(const std::string &label) {
    if (silent_) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    printer_.separator(label);
  }

  void line(const std::string &text) {
    if (silent_) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << text << std::endl;
  }

  std::ostream &stream() { return silent_ ? static_cast<std::ostream &>(sink_) : stream_; }
};

} // namespace customio
