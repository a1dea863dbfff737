#include "wangpaint/LogTee.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>

namespace wangpaint {

namespace {

std::filesystem::path RotatedPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

std::string TimestampUtcNow()
{
  using clock = std::chrono::system_clock;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now().time_since_epoch());
  const auto sec = std::chrono::duration_cast<std::chrono::seconds>(ms);

  const std::time_t tt = static_cast<std::time_t>(sec.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>((ms - sec).count()));
  return buf;
}

// Forwards every write to the console buffer and to the shared log file.
// Both tee buffers share one mutex and one line-start flag so interleaved
// stdout/stderr writes still get one prefix per file line.
class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, std::streambuf* file, std::mutex& m, bool& atLineStart, const char* tag,
         bool prefix)
      : m_console(console)
      , m_file(file)
      , m_mutex(m)
      , m_atLineStart(atLineStart)
      , m_tag(tag)
      , m_prefix(prefix)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return (xsputn(&c, 1) == 1) ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::lock_guard<std::mutex> lock(m_mutex);

    const std::streamsize written = m_console->sputn(s, n);

    const char* p = s;
    const char* end = s + n;
    while (p < end) {
      if (m_atLineStart && m_prefix) {
        const std::string pre = TimestampUtcNow() + " [" + m_tag + "] ";
        m_file->sputn(pre.data(), static_cast<std::streamsize>(pre.size()));
      }
      m_atLineStart = false;

      const char* nl = p;
      while (nl < end && *nl != '\n') ++nl;
      const bool hasNewline = (nl < end);
      const std::streamsize chunk = static_cast<std::streamsize>((hasNewline ? nl + 1 : end) - p);

      if (m_file->sputn(p, chunk) != chunk) break;
      if (hasNewline) {
        m_atLineStart = true;
        m_file->pubsync();
      }
      p += chunk;
    }

    return written;
  }

  int sync() override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int a = m_console->pubsync();
    const int b = m_file->pubsync();
    return (a == 0 && b == 0) ? 0 : -1;
  }

private:
  std::streambuf* m_console;
  std::streambuf* m_file;
  std::mutex& m_mutex;
  bool& m_atLineStart;
  std::string m_tag;
  bool m_prefix;
};

} // namespace

struct LogTee::Impl {
  std::ofstream file;
  std::filesystem::path path;
  std::mutex mutex;
  bool atLineStart = true;

  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeBuf> coutBuf;
  std::unique_ptr<TeeBuf> cerrBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

std::filesystem::path LogTee::path() const
{
  return m_impl ? m_impl->path : std::filesystem::path{};
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path src = RotatedPath(basePath, i - 1);
    const std::filesystem::path dst = RotatedPath(basePath, i);
    if (!std::filesystem::exists(src, ec)) continue;

    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      outError = "failed to rotate log '" + src.string() + "' -> '" + dst.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->path = opt.path;
  impl->file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }

  std::streambuf* fileBuf = impl->file.rdbuf();

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeBuf>(impl->origCout, fileBuf, impl->mutex, impl->atLineStart, "OUT",
                                             opt.prefixLines);
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeBuf>(impl->origCerr, fileBuf, impl->mutex, impl->atLineStart, "ERR",
                                             opt.prefixLines);
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Restore first so teardown output goes straight to the console.
  if (m_impl->coutBuf && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->cerrBuf && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->file.flush();
  m_impl.reset();
}

} // namespace wangpaint
