#include "client.hpp"
#include "error.hpp"
#include "log.hpp"
#include "socket.hpp"

#include <fmt/core.h>

#include <ostream>
#include <utility>
#include <variant>

namespace QManager{
    Client::Client(Client_Settings settings)
    : _settings(std::move(settings))
    {
        ignore_sigpipe();
        auto fd = open_tcp_client_socket(_settings.host, _settings.port);
        if( _settings.insecure ){
            _stream = std::make_unique<Plain_Stream>(std::move(fd), _settings.host);
        }
        else{
            _stream = Tls_Context::client(_settings.tls).connect(std::move(fd), _settings.host);
        }
    }

    std::string Client::raw_call(Request const& request)
    {
        auto document = encode_request(request);
        if( _settings.dump_json ){
            log(fmt::format("-> {}", document), Message_Type::DEBUG);
        }
        write_frame(*_stream, document);
        auto answer = read_frame(*_stream, MAX_FRAME_SIZE);
        if( !answer.has_value() ){
            throw Error(Error_Kind::PROTOCOL_ERROR, fmt::format("{} closed the connection without an answer.", _settings.host));
        }
        if( _settings.dump_json ){
            log(fmt::format("<- {}", *answer), Message_Type::DEBUG);
        }
        return *answer;
    }

    Response Client::_call(Request const& request)
    {
        auto response = decode_response(raw_call(request));
        if( auto const* error = std::get_if<Error_Response>(&response) ){
            throw Error(error->kind, error->message);
        }
        return response;
    }

    namespace{
        template<typename T>
        T expect(Response response)
        {
            if( auto* value = std::get_if<T>(&response) ){
                return std::move(*value);
            }
            throw Error(Error_Kind::PROTOCOL_ERROR, "Unexpected response type.");
        }
    }

    Job_Id Client::submit(std::string const& cmdline, std::optional<Seconds> expected_duration,
                          std::optional<std::string> const& notify_cmd)
    {
        return expect<Submit_Response>(_call(Submit_Request{cmdline, expected_duration, notify_cmd})).job_id;
    }

    Queue_Status_Response Client::queue_status()
    {
        return expect<Queue_Status_Response>(_call(Queue_Status_Request{}));
    }

    Job Client::remove(Job_Id id)
    {
        return expect<Job_Response>(_call(Remove_Request{id})).job;
    }

    void Client::kill(Job_Id id)
    {
        expect<Ok_Response>(_call(Kill_Request{id}));
    }

    Queue_State Client::pause()
    {
        return expect<Queue_State_Response>(_call(Pause_Request{})).state;
    }

    Queue_State Client::resume()
    {
        return expect<Queue_State_Response>(_call(Resume_Request{})).state;
    }

    void write_status(std::ostream& out, std::vector<Job> const& jobs)
    {
        auto optional_time = [](std::optional<Time_Point> const& tp){
            return tp.has_value() ? str_time(*tp) : std::string("n/a\t\t");
        };
        out << "Status\t\tID\tPID\tExpected\tSubmitted\t\tStarted\t\t\tFinished\t\tResult\tCommand\n";
        for( auto const& job : jobs ){
            std::string result = "n/a";
            if( job.state == Job_State::COMPLETED && job.exit_code.has_value() ){
                result = std::to_string(*job.exit_code);
            }
            else if( job.state == Job_State::FAILED ){
                result = job.reason;
            }
            out << "[" << to_string(job.state) << "]\t"
                << job.id << "\t"
                << (job.pid.has_value() ? std::to_string(*job.pid) : "n/a") << "\t"
                << (job.expected_duration.has_value() ? str_duration(*job.expected_duration) : "n/a") << "\t\t"
                << str_time(job.submitted_at) << "\t"
                << optional_time(job.started_at) << "\t"
                << optional_time(job.finished_at) << "\t"
                << result << "\t"
                << job.cmdline << "\n";
        }
    }
}
