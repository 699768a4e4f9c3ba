#include <gitcli/sink.hpp>

#include <unistd.h>

#include <cerrno>
#include <ios>
#include <system_error>

namespace gitcli {

void FdSink::write(const char *data, std::size_t n) {
  while (n > 0) {
    ssize_t w = ::write(fd_, data, n);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "sink write");
    }
    data += w;
    n -= static_cast<std::size_t>(w);
  }
}

void StreamSink::write(const char *data, std::size_t n) {
  os_.write(data, static_cast<std::streamsize>(n));
  if (!os_)
    throw std::ios_base::failure("sink stream write failed");
}

} // namespace gitcli
