#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace wangpaint {

// RAII helper that copies std::cout / std::cerr output into a log file while
// it is alive. Console output is unchanged.
//
// Each log file line is prefixed with a UTC timestamp and a stream tag:
//   2026-01-27T16:40:12.345Z [ERR] [trace] match: selected 3
//
// Existing logs rotate on start: <log> -> <log>.1 -> ... -> <log>.keepFiles.
struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 truncates the existing file instead.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Stops any active tee first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restores the original stream buffers. Safe to call repeatedly.
  void stop();

  bool active() const { return m_impl != nullptr; }
  std::filesystem::path path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace wangpaint
