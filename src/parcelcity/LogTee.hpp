#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace parcelcity {

// RAII helper that duplicates std::cout/std::cerr to a log file.
//
// Notifications, CLI progress and script output all go through the standard
// streams; a LogTee lets a headless run keep a persistent copy of them.
//
// Log file lines can be prefixed with a UTC timestamp, a stream tag and the
// current simulation tick:
//   2026-10-19T16:40:12.345Z [OUT] [tick=12] [notice:money_give] Level up: +2500$
// Console output is never modified.
struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep: <log> -> <log>.1 -> <log>.2 ...
  // 0 truncates the existing file instead.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;

  // Optional source for the [tick=N] prefix field.
  std::function<int()> tickSource;
};

class LogTee {
public:
  LogTee();
  LogTee(const LogTeeOptions& opt, std::string& outError);
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging, stopping any previous session first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace parcelcity
