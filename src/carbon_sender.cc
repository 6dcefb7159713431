#include "metro/carbon_sender.hh"
#include "metro/logging.hh"
#include <netinet/tcp.h>
#include <cstdint>

namespace metro {

static void check_timeout(const char *which, io_timeout t) {
    if (t <= io_timeout::zero() || t > max_io_timeout)
        throw errorx("carbon %s timeout out of range: %jd ms", which, intmax_t(t.count()));
}

carbon_sender::carbon_sender(std::string host, uint16_t port,
        io_timeout connect_timeout, io_timeout send_timeout)
    : _host(std::move(host)),
      _port(port),
      _connect_timeout(connect_timeout),
      _send_timeout(send_timeout)
{
    if (_host.empty())
        throw errorx("carbon host is empty");
    if (_port == 0)
        throw errorx("carbon port is 0");
    check_timeout("connect", _connect_timeout);
    check_timeout("send", _send_timeout);
}

carbon_sender::~carbon_sender() {
    close();
}

void carbon_sender::close() {
    if (_sock.valid()) {
        VLOG(1) << "closing carbon connection " << _sock << " to " << _host << ":" << _port;
        _sock.close();
    }
}

void carbon_sender::fail(const std::string &what) {
    ++_failures;
    _last_error = what;
    close();
}

// carbon never writes back, so a readable socket means eof or an error
bool carbon_sender::peer_closed() {
    char c;
    const ssize_t nr = _sock.recv(&c, 1, MSG_PEEK | MSG_DONTWAIT);
    if (nr == 0)
        return true;
    if (nr < 0)
        return !io_not_ready();
    return false;
}

void carbon_sender::ensure_connected() {
    if (_sock.valid()) {
        if (!peer_closed())
            return;
        LOG(INFO) << "carbon at " << _host << ":" << _port << " closed the connection";
        close();
    }
    _sock = netdial(_host, _port, _connect_timeout);
    _sock.setsockopt(IPPROTO_TCP, TCP_NODELAY, 1);
    ++_connects;
    LOG(INFO) << "connected to carbon at " << _host << ":" << _port;
}

void carbon_sender::send(const carbon_batch &lines, int64_t timestamp) {
    if (lines.empty())
        return;
    try {
        ensure_connected();
        const std::string buf = render_batch(lines, timestamp);
        VLOG(3) << "carbon batch: " << escape_bytes(buf);
        const ssize_t nw = netsend(_sock.fd, buf.data(), buf.size(), MSG_NOSIGNAL, _send_timeout);
        if (nw < 0)
            throw errno_error("send to %s:%u", _host.c_str(), (unsigned)_port);
        if (static_cast<size_t>(nw) != buf.size())
            throw errno_error(ETIMEDOUT, "short send to %s:%u (%zd of %zu bytes)",
                    _host.c_str(), (unsigned)_port, nw, buf.size());
        VLOG(2) << "sent " << lines.size() << " lines to " << _host << ":" << _port;
    } catch (errorx &e) {
        fail(e.what());
        throw;
    }
}

} // end namespace metro
