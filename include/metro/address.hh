#ifndef METRO_ADDRESS_HH
#define METRO_ADDRESS_HH

#include "metro/error.hh"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <string>
#include <string.h>
#include <ostream>
#include <sstream>
#include <boost/lexical_cast.hpp>

namespace metro {

//! split "host:port" in place; host is left untouched if there is no port
inline void parse_host_port(std::string &host, uint16_t &port) {
    size_t pos = host.rfind(':');
    // bare ipv6 literals carry colons of their own
    if (pos != std::string::npos && host.find(':') != pos && host[0] != '[')
        return;
    if (pos != std::string::npos) {
        const auto hp = host.substr(pos + 1);
        try {
            port = boost::lexical_cast<uint16_t>(hp);
        }
        catch (boost::bad_lexical_cast &) {
            throw errorx("invalid port number: %s", hp.c_str());
        }
        host = host.substr(0, pos);
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
            host = host.substr(1, host.size() - 2);
    }
}

//! an ipv4 or ipv6 socket address
class address {
private:
    sockaddr_storage _ss;

    sockaddr_in  *in4() { return reinterpret_cast<sockaddr_in *>(&_ss); }
    sockaddr_in6 *in6() { return reinterpret_cast<sockaddr_in6 *>(&_ss); }
    const sockaddr_in  *in4() const { return reinterpret_cast<const sockaddr_in *>(&_ss); }
    const sockaddr_in6 *in6() const { return reinterpret_cast<const sockaddr_in6 *>(&_ss); }

public:
    //! AF_UNSPEC, filled in by getsockname() or accept()
    address() { memset(&_ss, 0, sizeof _ss); }

    //! copy of a resolved address, as returned by getaddrinfo()
    address(const struct sockaddr *sa, socklen_t len) : address() {
        if ((sa->sa_family != AF_INET && sa->sa_family != AF_INET6) || len > sizeof _ss)
            throw errorx("unsupported sockaddr: family %d, len %u", sa->sa_family, (unsigned)len);
        memcpy(&_ss, sa, len);
    }

    //! \param host numeric ipv4 or ipv6 address
    //! \param port in host byte order
    explicit address(const char *host, uint16_t port = 0) : address() {
        if (inet_pton(AF_INET, host, &in4()->sin_addr) == 1) {
            in4()->sin_family = AF_INET;
            in4()->sin_port = htons(port);
        } else if (inet_pton(AF_INET6, host, &in6()->sin6_addr) == 1) {
            in6()->sin6_family = AF_INET6;
            in6()->sin6_port = htons(port);
        } else {
            throw errorx("invalid address: %s", host);
        }
    }

    //! \param s numeric address in "addr:port" format
    static address parse(const std::string &s) {
        std::string host = s;
        uint16_t port = 0;
        parse_host_port(host, port);
        return address(host.c_str(), port);
    }

    int family() const { return _ss.ss_family; }

    //! size of the sockaddr for family(), 0 when unset
    socklen_t addrlen() const {
        switch (family()) {
        case AF_INET:  return sizeof(sockaddr_in);
        case AF_INET6: return sizeof(sockaddr_in6);
        default:       return 0;
        }
    }

    //! room for any address, for calls that fill one in
    socklen_t capacity() const { return sizeof _ss; }

    struct sockaddr *sockaddr() { return reinterpret_cast<struct sockaddr *>(&_ss); }
    const struct sockaddr *sockaddr() const { return reinterpret_cast<const struct sockaddr *>(&_ss); }

    //! port in host byte order, 0 when unset
    uint16_t port() const {
        switch (family()) {
        case AF_INET:  return ntohs(in4()->sin_port);
        case AF_INET6: return ntohs(in6()->sin6_port);
        default:       return 0;
        }
    }

    //! numeric host, empty when unset
    std::string host() const {
        char buf[INET6_ADDRSTRLEN];
        const char *p = nullptr;
        switch (family()) {
        case AF_INET:  p = inet_ntop(AF_INET,  &in4()->sin_addr,  buf, sizeof buf); break;
        case AF_INET6: p = inet_ntop(AF_INET6, &in6()->sin6_addr, buf, sizeof buf); break;
        default:       return std::string();
        }
        throw_if(p == nullptr, "inet_ntop");
        return p;
    }

    //! "host:port", with the host in brackets for ipv6
    std::string str() const {
        std::ostringstream ss;
        ss << *this;
        return ss.str();
    }

    friend std::ostream &operator << (std::ostream &out, const address &a) {
        if (a.family() == AF_INET6)
            return out << "[" << a.host() << "]:" << a.port();
        if (a.family() == AF_INET)
            return out << a.host() << ":" << a.port();
        return out << "{unset}";
    }
};

} // end namespace metro

#endif // METRO_ADDRESS_HH
