#include "error.hpp"
#include "log.hpp"
#include "server.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <utility>
#include <variant>

#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace QManager{
    Server::Server(Queue& queue, Executor& executor, Server_Settings settings)
    : _queue(queue)
    , _executor(executor)
    , _settings(std::move(settings))
    , _stop_event(eventfd(0, EFD_CLOEXEC))
    , _port(0)
    {
        if( !_stop_event ){
            throw system_error(Error_Kind::IO_ERROR, "eventfd() failed", errno);
        }
        ignore_sigpipe();
    }

    Server::~Server(){
        _close_connections();
    }

    void Server::open()
    {
        if( !_settings.insecure ){
            _tls.emplace(Tls_Context::server(_settings.tls));
        }
        _listener = open_tcp_server_socket(_settings.port, &_port);
    }

    std::uint16_t Server::port() const{
        return _port;
    }

    void Server::run()
    {
        if( !_listener ){
            throw Error(Error_Kind::IO_ERROR, "Server is not listening.");
        }
        log(fmt::format("Listening on port {}{}.", _port, _tls ? "" : " without TLS"));
        pollfd fds[2] = {
            {_listener.get(), POLLIN, 0},
            {_stop_event.get(), POLLIN, 0}
        };
        while( true ){
            if( poll(fds, 2, -1) < 0 ){
                if( errno == EINTR ){
                    continue;
                }
                throw system_error(Error_Kind::IO_ERROR, "poll() failed", errno);
            }
            if( fds[1].revents & POLLIN ){
                break;
            }
            if( fds[0].revents & POLLIN ){
                std::string peer;
                auto fd = accept_connection(_listener.get(), peer);
                if( !fd.has_value() ){
                    log(fmt::format("accept() failed: {}", std::strerror(errno)), Message_Type::WARNING);
                    continue;
                }
                _spawn(std::move(*fd), peer);
            }
        }
        log("Server stopping.");
        _close_connections();
    }

    void Server::stop()
    {
        std::uint64_t one = 1;
        if( ::write(_stop_event.get(), &one, sizeof(one)) < 0 ){
            log(fmt::format("Cannot signal the accept loop: {}", std::strerror(errno)), Message_Type::ERROR);
        }
    }

    void Server::_spawn(File_Descriptor fd, std::string const& peer)
    {
        std::lock_guard<std::mutex> lock(_connections_mutex);
        _reap_connections();
        File_Descriptor control(fcntl(fd.get(), F_DUPFD_CLOEXEC, 0));
        if( !control ){
            log(fmt::format("Dropping connection from {}: {}", peer, std::strerror(errno)), Message_Type::WARNING);
            return;
        }
        auto& connection = _connections.emplace_back();
        connection.control = std::move(control);
        connection.thread = std::thread(&Server::_serve, this, std::ref(connection), std::move(fd), peer);
    }

    void Server::_serve(Connection& connection, File_Descriptor fd, std::string peer)
    {
        log(fmt::format("Connection from {}.", peer), Message_Type::DEBUG);
        try{
            std::unique_ptr<Stream> stream;
            if( _tls ){
                stream = _tls->accept(std::move(fd), peer);
            }
            else{
                stream = std::make_unique<Plain_Stream>(std::move(fd), peer);
            }
            while( auto frame = read_frame(*stream, _settings.max_frame_size) ){
                if( _settings.dump_json ){
                    log(fmt::format("{} -> {}", peer, *frame), Message_Type::DEBUG);
                }
                Response response;
                try{
                    response = handle(decode_request(*frame));
                }
                catch( Error const& e ){
                    if( e.kind() != Error_Kind::INVALID_REQUEST ){
                        throw;
                    }
                    response = Error_Response{e.kind(), e.what()};
                }
                auto document = encode_response(response);
                if( _settings.dump_json ){
                    log(fmt::format("{} <- {}", peer, document), Message_Type::DEBUG);
                }
                write_frame(*stream, document);
            }
            log(fmt::format("Connection from {} closed.", peer), Message_Type::DEBUG);
        }
        catch( Error const& e ){
            log(fmt::format("Closing connection from {}: {}", peer, e.what()), Message_Type::WARNING);
        }
        connection.done = true;
    }

    void Server::_reap_connections()
    {
        for( auto it = _connections.begin(); it != _connections.end(); ){
            if( it->done ){
                it->thread.join();
                it = _connections.erase(it);
            }
            else{
                ++it;
            }
        }
    }

    void Server::_close_connections()
    {
        std::list<Connection> connections;
        {
            std::lock_guard<std::mutex> lock(_connections_mutex);
            connections.splice(connections.end(), _connections);
        }
        for( auto& connection : connections ){
            ::shutdown(connection.control.get(), SHUT_RDWR);
        }
        for( auto& connection : connections ){
            if( connection.thread.joinable() ){
                connection.thread.join();
            }
        }
    }

    Response Server::handle(Request const& request)
    {
        try{
            return std::visit([this](auto const& r){ return _handle(r); }, request);
        }
        catch( Error const& e ){
            return Error_Response{e.kind(), e.what()};
        }
    }

    Response Server::_handle(Submit_Request const& request){
        _executor.validate(request.cmdline, request.notify_cmd);
        return Submit_Response{_queue.submit(request.cmdline, request.expected_duration, request.notify_cmd)};
    }

    Response Server::_handle(Queue_Status_Request const&){
        return Queue_Status_Response{_queue.snapshot(), _queue.state()};
    }

    Response Server::_handle(Remove_Request const& request){
        return Job_Response{_queue.remove(request.job_id)};
    }

    Response Server::_handle(Kill_Request const& request){
        _executor.terminate(request.job_id);
        return Ok_Response{};
    }

    Response Server::_handle(Pause_Request const&){
        return Queue_State_Response{_queue.pause()};
    }

    Response Server::_handle(Resume_Request const&){
        return Queue_State_Response{_queue.resume()};
    }
}
