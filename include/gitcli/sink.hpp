#pragma once
#include <cstddef>
#include <ostream>
#include <string>

namespace gitcli {

// Destination for streamed subprocess output. write() reports failure by
// throwing; the runner aborts the invocation and wraps the exception in a
// ProcessIOError.
class Sink {
public:
  virtual ~Sink() = default;
  virtual void write(const char *data, std::size_t n) = 0;
};

class StringSink : public Sink {
public:
  void write(const char *data, std::size_t n) override { buf_.append(data, n); }
  const std::string &str() const { return buf_; }

private:
  std::string buf_;
};

// Does not own the descriptor.
class FdSink : public Sink {
public:
  explicit FdSink(int fd) : fd_(fd) {}
  void write(const char *data, std::size_t n) override;

private:
  int fd_;
};

class StreamSink : public Sink {
public:
  explicit StreamSink(std::ostream &os) : os_(os) {}
  void write(const char *data, std::size_t n) override;

private:
  std::ostream &os_;
};

} // namespace gitcli
