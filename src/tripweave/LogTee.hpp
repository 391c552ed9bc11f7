#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace tripweave {

// Duplicates std::cout / std::cerr to a log file for the lifetime of the object.
//
// Console output is untouched. File lines get a UTC timestamp and a stream
// tag when prefixLines is set:
//   2026-03-02T08:15:04.120Z [ERR] [planner] internal invariant violated: ...
//
// Existing logs are rotated on start: <log> -> <log>.1 -> <log>.2 ...

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 truncates the existing file instead.
  int keepFiles = 2;

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

  // Restarts when already active.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers and close the file.
  void stop();

  bool active() const { return m_impl != nullptr; }

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace tripweave
