#include "app/LineSink.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace ssample::app {

// ---- FileSink ----

std::unique_ptr<FileSink> FileSink::open(const std::string& path) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    std::fprintf(stderr, "ssample: %s: %s\n", path.c_str(), std::strerror(errno));
    return nullptr;
  }
  std::FILE* f = ::fdopen(fd, "a");
  if (!f) {
    std::fprintf(stderr, "ssample: %s: fdopen: %s\n", path.c_str(), std::strerror(errno));
    ::close(fd);
    return nullptr;
  }
  return std::unique_ptr<FileSink>(new FileSink(path, f));
}

FileSink::~FileSink() { close(); }

bool FileSink::write_line(std::string_view line) {
  if (!file_) {
    error_ = "sink closed";
    return false;
  }
  if ((!line.empty() && std::fwrite(line.data(), 1, line.size(), file_) != line.size()) ||
      std::fputc('\n', file_) == EOF) {
    error_ = std::strerror(errno);
    return false;
  }
  return true;
}

bool FileSink::close() {
  if (!file_) return true;
  bool ok = std::fclose(file_) == 0;
  file_ = nullptr;
  return ok;
}

// ---- GzipSink ----

std::unique_ptr<GzipSink> GzipSink::open(const std::string& path) {
  errno = 0;
  gzFile gz = ::gzopen(path.c_str(), "wb");
  if (!gz) {
    // gzopen leaves errno set for open() failures; 0 means zlib ran out of memory
    std::fprintf(stderr, "ssample: %s: %s\n", path.c_str(),
                 errno ? std::strerror(errno) : "gzopen failed");
    return nullptr;
  }
  return std::unique_ptr<GzipSink>(new GzipSink(path, gz));
}

GzipSink::~GzipSink() { close(); }

// errno is not meaningful after a zlib failure; gzerror carries the
// strerror text itself when the underlying write failed.
bool GzipSink::fail() {
  int code = Z_OK;
  const char* msg = ::gzerror(gz_, &code);
  error_ = (msg && *msg) ? msg : "gzip write failed";
  return false;
}

bool GzipSink::write_line(std::string_view line) {
  if (!gz_) {
    error_ = "sink closed";
    return false;
  }
  // gzfwrite takes a size_t length; gzwrite's unsigned would truncate lines over 4 GiB
  if (!line.empty() && ::gzfwrite(line.data(), 1, line.size(), gz_) != line.size()) return fail();
  if (::gzputc(gz_, '\n') == -1) return fail();
  return true;
}

bool GzipSink::close() {
  if (!gz_) return true;
  int rc = ::gzclose(gz_);
  gz_ = nullptr;
  return rc == Z_OK;
}

// ---- StdoutSink ----

bool StdoutSink::write_line(std::string_view line) {
  if ((!line.empty() && std::fwrite(line.data(), 1, line.size(), stdout) != line.size()) ||
      std::fputc('\n', stdout) == EOF) {
    error_ = std::strerror(errno);
    return false;
  }
  return true;
}

bool StdoutSink::close() {
  return std::fflush(stdout) == 0;
}

} // namespace ssample::app
