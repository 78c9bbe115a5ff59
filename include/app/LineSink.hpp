#pragma once
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <zlib.h>

namespace ssample::app {

// Auxiliary destination that receives every input line as it is read.
class LineSink {
public:
  virtual ~LineSink() = default;

  // Writes line plus '\n'. Returns false on I/O failure.
  [[nodiscard]] virtual bool write_line(std::string_view line) = 0;

  // Flush and release. Safe to call twice. Returns false if buffered data was lost.
  virtual bool close() = 0;

  [[nodiscard]] virtual const std::string& name() const = 0;

  // Description of the most recent write_line failure, empty if none.
  [[nodiscard]] virtual std::string last_error() const = 0;
};

// Plain file opened for append (created if missing).
class FileSink final : public LineSink {
public:
  ~FileSink() override;
  [[nodiscard]] static std::unique_ptr<FileSink> open(const std::string& path);

  [[nodiscard]] bool write_line(std::string_view line) override;
  bool close() override;
  [[nodiscard]] const std::string& name() const override { return path_; }
  [[nodiscard]] std::string last_error() const override { return error_; }

private:
  FileSink(std::string path, std::FILE* f) : path_(std::move(path)), file_(f) {}
  std::string path_;
  std::FILE* file_{nullptr};
  std::string error_;
};

// gzip-compressed file. gzip streams cannot be appended to, so an
// existing file is truncated.
class GzipSink final : public LineSink {
public:
  ~GzipSink() override;
  [[nodiscard]] static std::unique_ptr<GzipSink> open(const std::string& path);

  [[nodiscard]] bool write_line(std::string_view line) override;
  bool close() override;
  [[nodiscard]] const std::string& name() const override { return path_; }
  [[nodiscard]] std::string last_error() const override { return error_; }

private:
  GzipSink(std::string path, gzFile gz) : path_(std::move(path)), gz_(gz) {}
  bool fail();

  std::string path_;
  gzFile gz_{nullptr};
  std::string error_;
};

// Echo to the process's stdout. close() only flushes.
class StdoutSink final : public LineSink {
public:
  [[nodiscard]] bool write_line(std::string_view line) override;
  bool close() override;
  [[nodiscard]] const std::string& name() const override { return name_; }
  [[nodiscard]] std::string last_error() const override { return error_; }

private:
  std::string name_{"<stdout>"};
  std::string error_;
};

} // namespace ssample::app
