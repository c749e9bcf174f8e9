#pragma once

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#ifdef _WIN32
#include <io.h>
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

// Simple ANSI color printer for terminals.
// Usage:
//   customio::ColorPrinter cp; // defaults to std::cout; auto-enables on a TTY
//   cp.separator("oh-my-zsh");  // ── oh-my-zsh ─────────────────────
//   cp.red() << "FAILED" << '\n';
//   cp.green() << "OK" << '\n';

namespace customio {

class ColorPrinter {
 public:
  // A scoped color stream; emits color code on construction, reset on destruction.
  class ColorProxy {
   public:
    ColorProxy(std::ostream& os, const char* code, bool enabled)
        : os_(os), enabled_(enabled) {
      if (enabled_) os_ << code;
    }
    ~ColorProxy() {
      if (enabled_) os_ << "\033[0m"; // reset
    }
    template <typename T>
    ColorProxy& operator<<(const T& v) {
      os_ << v;
      return *this;
    }
    using Manip = std::ostream& (*)(std::ostream&);
    ColorProxy& operator<<(Manip m) {
      m(os_);
      return *this;
    }

   private:
    std::ostream& os_;
    bool enabled_;
  };

  ColorPrinter()
      : stream_(&std::cout), enable_colors_(detect_tty_for_stream(std::cout)) {}

  explicit ColorPrinter(std::ostream& os)
      : stream_(&os), enable_colors_(detect_tty_for_stream(os)) {}

  ColorPrinter(std::ostream& os, bool enable_colors)
      : stream_(&os), enable_colors_(enable_colors) {}

  void set_enabled(bool enabled) { enable_colors_ = enabled; }
  bool enabled() const { return enable_colors_; }

  std::ostream& stream() { return *stream_; }

  ColorProxy red() { return ColorProxy(*stream_, "\033[31m", enable_colors_); }
  ColorProxy green() { return ColorProxy(*stream_, "\033[32m", enable_colors_); }
  ColorProxy yellow() { return ColorProxy(*stream_, "\033[33m", enable_colors_); }
  ColorProxy cyan() { return ColorProxy(*stream_, "\033[36m", enable_colors_); }
  ColorProxy bold() { return ColorProxy(*stream_, "\033[1m", enable_colors_); }

  // Prints "── <label> ───..." padded to the terminal width.
  void separator(const std::string& label) {
    const std::size_t width = terminal_width();
    std::string line = "── " + label + " ";
    std::size_t visible = label.size() + 4;
    while (visible < width) {
      line += "─";
      ++visible;
    }
    *stream_ << '\n';
    bold() << line;
    *stream_ << std::endl;
  }

 private:
  std::ostream* stream_;
  bool enable_colors_;

  static constexpr std::size_t kDefaultWidth = 80;

  std::size_t terminal_width() const {
#ifndef _WIN32
    if (enable_colors_) {
      struct winsize ws {};
      if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
      }
    }
#endif
    if (const char* cols = std::getenv("COLUMNS")) {
      char* end = nullptr;
      long v = std::strtol(cols, &end, 10);
      if (end != cols && v > 0) return static_cast<std::size_t>(v);
    }
    return kDefaultWidth;
  }

  static bool detect_tty_for_stream(std::ostream& os) {
    if (std::getenv("NO_COLOR") != nullptr) return false;
#ifdef _WIN32
    if (&os == &std::cout) return _isatty(_fileno(stdout));
    if (&os == &std::cerr) return _isatty(_fileno(stderr));
#else
    if (&os == &std::cout) return ::isatty(STDOUT_FILENO);
    if (&os == &std::cerr) return ::isatty(STDERR_FILENO);
#endif
    return false;
  }
};

}  // namespace customio
