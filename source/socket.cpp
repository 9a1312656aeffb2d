#include "error.hpp"
#include "socket.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace QManager{
    File_Descriptor::File_Descriptor(int fd)
    : _fd(fd)
    {}

    File_Descriptor::~File_Descriptor(){
        reset();
    }

    File_Descriptor::File_Descriptor(File_Descriptor&& o) noexcept
    : _fd(o.release())
    {}

    File_Descriptor& File_Descriptor::operator=(File_Descriptor&& o) noexcept{
        if( this != &o ){
            reset(o.release());
        }
        return *this;
    }

    int File_Descriptor::get() const{
        return _fd;
    }

    int File_Descriptor::release(){
        return std::exchange(_fd, -1);
    }

    void File_Descriptor::reset(int fd){
        if( _fd >= 0 ){
            ::close(_fd);
        }
        _fd = fd;
    }

    File_Descriptor::operator bool() const{
        return _fd >= 0;
    }

    namespace{
        File_Descriptor bind_any(int family, std::uint16_t port){
            File_Descriptor fd(socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0));
            if( !fd ){
                throw system_error(Error_Kind::IO_ERROR, "socket() failed", errno);
            }
            int yes = 1;
            setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
            int rc;
            if( family == AF_INET6 ){
                int no = 0;
                setsockopt(fd.get(), IPPROTO_IPV6, IPV6_V6ONLY, &no, sizeof(no));
                sockaddr_in6 addr{};
                addr.sin6_family = AF_INET6;
                addr.sin6_addr = in6addr_any;
                addr.sin6_port = htons(port);
                rc = bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
            }else{
                sockaddr_in addr{};
                addr.sin_family = AF_INET;
                addr.sin_addr.s_addr = htonl(INADDR_ANY);
                addr.sin_port = htons(port);
                rc = bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
            }
            if( rc < 0 ){
                throw system_error(Error_Kind::IO_ERROR, fmt::format("bind() to port {} failed", port), errno);
            }
            return fd;
        }

        std::uint16_t local_port(int fd){
            sockaddr_storage addr{};
            socklen_t len = sizeof(addr);
            if( getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0 ){
                throw system_error(Error_Kind::IO_ERROR, "getsockname() failed", errno);
            }
            if( addr.ss_family == AF_INET6 ){
                return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
            }
            return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
        }

        std::string peer_name(sockaddr_storage const& addr){
            char host[INET6_ADDRSTRLEN] = {};
            std::uint16_t port = 0;
            if( addr.ss_family == AF_INET6 ){
                auto const* in6 = reinterpret_cast<sockaddr_in6 const*>(&addr);
                inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
                port = ntohs(in6->sin6_port);
                return fmt::format("[{}]:{}", host, port);
            }
            auto const* in = reinterpret_cast<sockaddr_in const*>(&addr);
            inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
            port = ntohs(in->sin_port);
            return fmt::format("{}:{}", host, port);
        }
    }

    File_Descriptor open_tcp_server_socket(std::uint16_t port, std::uint16_t* selected)
    {
        File_Descriptor fd;
        try{
            fd = bind_any(AF_INET6, port);
        }
        catch( Error const& ){
            fd = bind_any(AF_INET, port);
        }
        if( listen(fd.get(), SOMAXCONN) < 0 ){
            throw system_error(Error_Kind::IO_ERROR, "listen() failed", errno);
        }
        if( selected != nullptr ){
            *selected = local_port(fd.get());
        }
        return fd;
    }

    File_Descriptor open_tcp_client_socket(std::string const& host, std::uint16_t port)
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* result = nullptr;
        auto service = std::to_string(port);
        if( int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result); rc != 0 ){
            throw Error(Error_Kind::IO_ERROR, fmt::format("Cannot resolve {}: {}", host, gai_strerror(rc)));
        }
        int last_error = 0;
        File_Descriptor fd;
        for( auto* ai = result; ai != nullptr; ai = ai->ai_next ){
            fd.reset(socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
            if( !fd ){
                last_error = errno;
                continue;
            }
            if( connect(fd.get(), ai->ai_addr, ai->ai_addrlen) == 0 ){
                break;
            }
            last_error = errno;
            fd.reset();
        }
        freeaddrinfo(result);
        if( !fd ){
            throw system_error(Error_Kind::IO_ERROR, fmt::format("Cannot connect to {}:{}", host, port), last_error);
        }
        return fd;
    }

    std::optional<File_Descriptor> accept_connection(int listen_fd, std::string& peer)
    {
        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        int client = accept4(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
        if( client < 0 ){
            return std::nullopt;
        }
        peer = peer_name(addr);
        return File_Descriptor(client);
    }
}
