#ifndef LIBMETRO_NET_HH
#define LIBMETRO_NET_HH

#include "metro/descriptors.hh"
#include <chrono>
#include <limits>
#include <string>

namespace metro {

//! i/o timeout; zero or negative waits forever
using io_timeout = std::chrono::milliseconds;

//! longest wait poll() can express
constexpr io_timeout max_io_timeout{std::numeric_limits<int>::max()};

class hostname_error : public errorx {
public:
    template <class ...A>
    hostname_error(const char *s, A... args) : errorx(s, std::forward<A>(args)...) {}
};

//! wait until fd is readable ('r') or writable ('w')
//! \return false on timeout
bool fdwait(int fd, int rw, io_timeout ms);

//! resolve host and connect a nonblocking stream socket to the first address that accepts
//! all errors by exception
socket_fd netdial(const std::string &host, uint16_t port, io_timeout connect_ms);
//! connect a nonblocking fd, waiting at most ms
//! on timeout, caller should close, since the kernel may still be trying to connect
int netconnect(int fd, const address &addr, io_timeout ms);
//! send all of buf on a nonblocking fd unless an error or timeout stops it
//! \return bytes sent, or -1 if nothing could be sent
ssize_t netsend(int fd, const void *buf, size_t len, int flags, io_timeout ms);
//! receive on a nonblocking fd, waiting at most ms for data
ssize_t netrecv(int fd, void *buf, size_t len, int flags, io_timeout ms);

} // end namespace metro

#endif // LIBMETRO_NET_HH
