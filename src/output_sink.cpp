#include "output_sink.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

std::size_t FdSink::write(std::string_view bytes) {
  if (broken_) return 0;
  std::size_t done = 0;
  while (done < bytes.size()) {
    ssize_t n = ::write(fd_, bytes.data() + done, bytes.size() - done);
    if (n >= 0) { done += static_cast<std::size_t>(n); continue; }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      pollfd p{fd_, POLLOUT, 0};
      if (::poll(&p, 1, 100) >= 0) continue;
    }
    broken_ = true;
    spdlog::error("output write failed on fd {}: {}", fd_, std::strerror(errno));
    break;
  }
  return done;
}
