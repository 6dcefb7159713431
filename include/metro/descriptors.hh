#ifndef LIBMETRO_DESCRIPTORS_HH
#define LIBMETRO_DESCRIPTORS_HH

#include "metro/error.hh"
#include "metro/address.hh"
#include "metro/logging.hh"

#include <errno.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <ostream>
#include <utility>

namespace metro {

//! true when a nonblocking call failed only because it would block
inline bool io_not_ready(int e = errno) {
#if defined(EWOULDBLOCK) && (EWOULDBLOCK != EAGAIN)
    return (e == EAGAIN) || (e == EWOULDBLOCK);
#else
    return (e == EAGAIN);
#endif
}

//! owning socket descriptor
//
//! movable, not copyable; closed on destruction
struct socket_fd {
    //! the descriptor, -1 when empty
    int fd;

    //! new close-on-exec socket
    socket_fd(int domain, int type, int protocol = 0)
        : fd(::socket(domain, type | SOCK_CLOEXEC, protocol))
    {
        throw_if(fd == -1, "socket");
    }

    //! take ownership of an open descriptor, e.g. from accept()
    explicit socket_fd(int fd_ = -1) noexcept : fd(fd_) {}

    socket_fd(socket_fd &&other) noexcept : fd(other.fd) { other.fd = -1; }

    socket_fd &operator = (socket_fd &&other) noexcept {
        if (this != &other) {
            close();
            std::swap(fd, other.fd);
        }
        return *this;
    }

    ~socket_fd() { close(); }

    bool valid() const { return fd != -1; }

    void close() noexcept {
        if (fd == -1)
            return;
        // linux releases the descriptor even when close() reports an error
        if (::close(fd) == -1)
            PLOG(WARNING) << "close(" << fd << ")";
        fd = -1;
    }

    void bind(const address &addr) {
        throw_if(::bind(fd, addr.sockaddr(), addr.addrlen()) == -1, "bind %s", addr.str().c_str());
    }

    void listen(int backlog = 128) {
        throw_if(::listen(fd, backlog) == -1, "listen");
    }

    ssize_t recv(void *buf, size_t len, int flags = 0) __attribute__((warn_unused_result)) {
        return ::recv(fd, buf, len, flags);
    }

    ssize_t send(const void *buf, size_t len, int flags = 0) __attribute__((warn_unused_result)) {
        return ::send(fd, buf, len, flags);
    }

    //! \param addr set to the local address
    void getsockname(address &addr) {
        socklen_t len = addr.capacity();
        throw_if(::getsockname(fd, addr.sockaddr(), &len) == -1, "getsockname");
    }

    template <typename T> void setsockopt(int level, int optname, const T &optval) {
        throw_if(::setsockopt(fd, level, optname, &optval, sizeof optval) == -1,
                "setsockopt %d/%d", level, optname);
    }

    //! \param addr set to the peer address
    //! \param flags 0 or SOCK_NONBLOCK; SOCK_CLOEXEC is always added
    //! \return the new descriptor, or -1 with errno set
    int accept(address &addr, int flags = 0) __attribute__((warn_unused_result)) {
        socklen_t len = addr.capacity();
        return ::accept4(fd, addr.sockaddr(), &len, flags | SOCK_CLOEXEC);
    }

    friend std::ostream &operator << (std::ostream &out, const socket_fd &s) {
        return out << "socket_fd(" << s.fd << ")";
    }
};

} // end namespace metro

#endif // LIBMETRO_DESCRIPTORS_HH
