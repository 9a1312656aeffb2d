#include "error.hpp"
#include "file_lock.hpp"
#include "log.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstdio>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace QManager{
    Pid_File::Pid_File(std::string file)
    : _file(std::move(file))
    , _fd(::open(_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644))
    {
        if( !_fd ){
            throw system_error(Error_Kind::IO_ERROR, fmt::format("Cannot open pid file {}", _file), errno);
        }
        if( flock(_fd.get(), LOCK_EX | LOCK_NB) < 0 ){
            if( errno == EWOULDBLOCK ){
                throw Error(Error_Kind::ALREADY_RUNNING, fmt::format("Another daemon holds {}.", _file));
            }
            throw system_error(Error_Kind::IO_ERROR, fmt::format("Cannot lock pid file {}", _file), errno);
        }
        update();
    }

    Pid_File::~Pid_File(){
        if( std::remove(_file.c_str()) != 0 ){
            log(fmt::format("Cannot remove pid file {}.", _file), Message_Type::WARNING);
        }
    }

    void Pid_File::update(){
        auto content = fmt::format("{}\n", getpid());
        if( ftruncate(_fd.get(), 0) < 0
            || pwrite(_fd.get(), content.data(), content.size(), 0) != static_cast<ssize_t>(content.size()) ){
            throw system_error(Error_Kind::IO_ERROR, fmt::format("Cannot write pid file {}", _file), errno);
        }
    }

    std::string const& Pid_File::file() const{
        return _file;
    }
}
