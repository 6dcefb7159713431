#include "metro/net.hh"

#include <netdb.h>
#include <poll.h>
#include <algorithm>
#include <memory>

namespace metro {

// pending error on a socket, e.g. the outcome of a nonblocking connect
static int socket_error(int fd) {
    int e = 0;
    socklen_t len = sizeof e;
    throw_if(::getsockopt(fd, SOL_SOCKET, SO_ERROR, &e, &len) == -1, "getsockopt");
    return e;
}

bool fdwait(int fd, int rw, io_timeout ms) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = (rw == 'r') ? POLLIN : POLLOUT;
    pfd.revents = 0;
    int timeout = -1;
    if (ms.count() > 0)
        timeout = static_cast<int>(std::min(ms, max_io_timeout).count());
    for (;;) {
        const int n = ::poll(&pfd, 1, timeout);
        if (n == -1 && errno == EINTR)
            continue;
        throw_if(n == -1, "poll");
        // errors and hangups are reported by the following i/o call
        return n > 0;
    }
}

int netconnect(int fd, const address &addr, io_timeout ms) {
    if (::connect(fd, addr.sockaddr(), addr.addrlen()) == 0)
        return 0;
    if (errno != EINPROGRESS && errno != EINTR)
        return -1;
    if (!fdwait(fd, 'w', ms)) {
        errno = ETIMEDOUT;
        return -1;
    }
    const int e = socket_error(fd);
    if (e == 0)
        return 0;
    errno = e;
    return -1;
}

ssize_t netsend(int fd, const void *buf, size_t len, int flags, io_timeout ms) {
    const char *p = static_cast<const char *>(buf);
    size_t sent = 0;
    while (sent < len) {
        const ssize_t nw = ::send(fd, p + sent, len - sent, flags);
        if (nw >= 0) {
            sent += static_cast<size_t>(nw);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (!io_not_ready())
            break;
        if (!fdwait(fd, 'w', ms)) {
            errno = ETIMEDOUT;
            break;
        }
    }
    if (sent == 0 && len > 0)
        return -1;
    return static_cast<ssize_t>(sent);
}

ssize_t netrecv(int fd, void *buf, size_t len, int flags, io_timeout ms) {
    for (;;) {
        const ssize_t nr = ::recv(fd, buf, len, flags);
        if (nr >= 0)
            return nr;
        if (errno == EINTR)
            continue;
        if (!io_not_ready())
            return -1;
        if (!fdwait(fd, 'r', ms)) {
            errno = ETIMEDOUT;
            return -1;
        }
    }
}

socket_fd netdial(const std::string &host, uint16_t port, io_timeout connect_ms) {
    addrinfo hints;
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV | AI_ADDRCONFIG;

    const std::string service = std::to_string(port);
    addrinfo *results = nullptr;
    const int status = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (status != 0) {
        throw hostname_error("getaddrinfo %s: %s", host.c_str(), gai_strerror(status));
    }
    std::unique_ptr<addrinfo, void (*)(addrinfo *)> ai{results, freeaddrinfo};

    int last_error = EADDRNOTAVAIL;
    for (addrinfo *rp = ai.get(); rp != nullptr; rp = rp->ai_next) {
        // a failed nonblocking connect leaves the socket unusable, so one socket per address
        socket_fd s{rp->ai_family, rp->ai_socktype | SOCK_NONBLOCK, rp->ai_protocol};
        address addr(rp->ai_addr, rp->ai_addrlen);
        if (netconnect(s.fd, addr, connect_ms) == 0) {
            VLOG(2) << "connected to " << host << " at " << addr;
            return s;
        }
        last_error = errno;
        VLOG(2) << "connect to " << addr << " failed: " << strerror(last_error);
    }
    throw errno_error(last_error, "connect %s:%u", host.c_str(), (unsigned)port);
}

} // end namespace metro
