#pragma once

#include <cstddef>
#include <errno.h>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

// Blocking writers for the diagnostic log (stderr) and the session log file.
// Both retry interrupted or would-block writes; any other failure returns
// false and the caller decides whether the descriptor stays in use.
namespace io {

namespace detail {

inline bool ShouldRetry(int err) {
  if (err == EINTR) {
    return true;
  }
  if (err == EAGAIN || err == EWOULDBLOCK) {
    std::this_thread::yield();
    return true;
  }
  return false;
}

// Drops `n` written bytes from the front of the iovec array.
inline void Advance(struct iovec *&iov, int &cnt, std::size_t n) {
  while (cnt > 0 && n >= iov->iov_len) {
    n -= iov->iov_len;
    ++iov;
    --cnt;
  }
  if (cnt > 0 && n > 0) {
    iov->iov_base = static_cast<char *>(iov->iov_base) + n;
    iov->iov_len -= n;
  }
}

} // namespace detail

// iov entries are modified in place on partial writes.
inline bool WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    const ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (detail::ShouldRetry(errno)) {
        continue;
      }
      return false;
    }
    detail::Advance(iov, cnt, static_cast<std::size_t>(n));
  }
  return true;
}

inline bool WriteAll(int fd, const char *data, std::size_t len) {
  struct iovec one{const_cast<char *>(data), len};
  return WritevAll(fd, &one, len > 0 ? 1 : 0);
}

} // namespace io
