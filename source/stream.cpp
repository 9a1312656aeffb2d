#include "error.hpp"
#include "stream.hpp"

#include <cerrno>
#include <csignal>
#include <utility>

#include <sys/socket.h>

namespace QManager{
    void ignore_sigpipe(){
        std::signal(SIGPIPE, SIG_IGN);
    }

    std::size_t Stream::read_exact(char* buffer, std::size_t size){
        std::size_t done = 0;
        while( done < size ){
            auto n = read_some(buffer + done, size - done);
            if( n == 0 ){
                break;
            }
            done += n;
        }
        return done;
    }

    Plain_Stream::Plain_Stream(File_Descriptor fd, std::string peer)
    : _fd(std::move(fd))
    , _peer(std::move(peer))
    {}

    std::size_t Plain_Stream::read_some(char* buffer, std::size_t size){
        while( true ){
            auto n = ::recv(_fd.get(), buffer, size, 0);
            if( n >= 0 ){
                return static_cast<std::size_t>(n);
            }
            if( errno != EINTR ){
                throw system_error(Error_Kind::IO_ERROR, "recv() failed", errno);
            }
        }
    }

    void Plain_Stream::write_all(char const* data, std::size_t size){
        std::size_t done = 0;
        while( done < size ){
            auto n = ::send(_fd.get(), data + done, size - done, MSG_NOSIGNAL);
            if( n < 0 ){
                if( errno == EINTR ){
                    continue;
                }
                throw system_error(Error_Kind::IO_ERROR, "send() failed", errno);
            }
            done += static_cast<std::size_t>(n);
        }
    }

    void Plain_Stream::shutdown(){
        ::shutdown(_fd.get(), SHUT_RDWR);
    }

    std::string const& Plain_Stream::peer() const{
        return _peer;
    }
}
