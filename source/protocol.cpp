#include "protocol.hpp"

#include <fmt/core.h>

#include <array>
#include <type_traits>

namespace QManager{
    using nlohmann::json;

    namespace{
        template <typename... Ts>
        struct Overloaded : Ts...{
            using Ts::operator()...;
        };
        template <typename... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;

        std::string dump(json const& j){
            // Captured output may hold arbitrary bytes.
            return j.dump(-1, ' ', false, json::error_handler_t::replace);
        }

        json parse_object(std::string const& document){
            json j;
            try{
                j = json::parse(document);
            }
            catch( json::parse_error const& e ){
                throw Error(Error_Kind::PROTOCOL_ERROR, fmt::format("Malformed document: {}", e.what()));
            }
            if( !j.is_object() || !j.contains("type") || !j["type"].is_string() ){
                throw Error(Error_Kind::PROTOCOL_ERROR, "Document is not a typed object.");
            }
            return j;
        }

        json const& field(json const& j, char const* key, Error_Kind kind){
            auto it = j.find(key);
            if( it == j.end() ){
                throw Error(kind, fmt::format("Missing field `{}`.", key));
            }
            return *it;
        }

        std::string string_field(json const& j, char const* key, Error_Kind kind){
            auto const& v = field(j, key, kind);
            if( !v.is_string() ){
                throw Error(kind, fmt::format("Field `{}` must be a string.", key));
            }
            return v.get<std::string>();
        }

        std::optional<std::string> optional_string_field(json const& j, char const* key, Error_Kind kind){
            if( !j.contains(key) || j[key].is_null() ){
                return std::nullopt;
            }
            return string_field(j, key, kind);
        }

        std::uint64_t unsigned_field(json const& j, char const* key, Error_Kind kind){
            auto const& v = field(j, key, kind);
            if( !v.is_number_unsigned() && !(v.is_number_integer() && v.get<long long int>() >= 0) ){
                throw Error(kind, fmt::format("Field `{}` must be a non-negative integer.", key));
            }
            return v.get<std::uint64_t>();
        }

        std::optional<long long int> optional_integer_field(json const& j, char const* key, Error_Kind kind){
            if( !j.contains(key) || j[key].is_null() ){
                return std::nullopt;
            }
            auto const& v = j[key];
            if( !v.is_number_integer() ){
                throw Error(kind, fmt::format("Field `{}` must be an integer.", key));
            }
            return v.get<long long int>();
        }

        std::optional<Time_Point> optional_time_field(json const& j, char const* key){
            auto micros = optional_integer_field(j, key, Error_Kind::PROTOCOL_ERROR);
            if( !micros.has_value() ){
                return std::nullopt;
            }
            return from_micros(*micros);
        }

        Queue_State queue_state_field(json const& j, char const* key){
            auto name = string_field(j, key, Error_Kind::PROTOCOL_ERROR);
            auto state = queue_state_from_string(name);
            if( !state.has_value() ){
                throw Error(Error_Kind::PROTOCOL_ERROR, fmt::format("Unknown queue state `{}`.", name));
            }
            return *state;
        }
    }

    bool operator==(Submit_Request const& a, Submit_Request const& b){
        return a.cmdline == b.cmdline && a.expected_duration == b.expected_duration && a.notify_cmd == b.notify_cmd;
    }
    bool operator==(Queue_Status_Request const&, Queue_Status_Request const&){
        return true;
    }
    bool operator==(Remove_Request const& a, Remove_Request const& b){
        return a.job_id == b.job_id;
    }
    bool operator==(Kill_Request const& a, Kill_Request const& b){
        return a.job_id == b.job_id;
    }
    bool operator==(Pause_Request const&, Pause_Request const&){
        return true;
    }
    bool operator==(Resume_Request const&, Resume_Request const&){
        return true;
    }
    bool operator==(Submit_Response const& a, Submit_Response const& b){
        return a.job_id == b.job_id;
    }
    bool operator==(Queue_Status_Response const& a, Queue_Status_Response const& b){
        return a.jobs == b.jobs && a.state == b.state;
    }
    bool operator==(Job_Response const& a, Job_Response const& b){
        return a.job == b.job;
    }
    bool operator==(Ok_Response const&, Ok_Response const&){
        return true;
    }
    bool operator==(Queue_State_Response const& a, Queue_State_Response const& b){
        return a.state == b.state;
    }
    bool operator==(Error_Response const& a, Error_Response const& b){
        return a.kind == b.kind && a.message == b.message;
    }

    json job_to_json(Job const& job, bool with_output)
    {
        json j{
            {"id", job.id},
            {"cmdline", job.cmdline},
            {"status", to_string(job.state)},
            {"submitted_at", to_micros(job.submitted_at)}
        };
        if( job.expected_duration.has_value() ){
            j["expected_duration"] = job.expected_duration->count();
        }
        if( job.notify_cmd.has_value() ){
            j["notify_cmd"] = *job.notify_cmd;
        }
        if( job.exit_code.has_value() ){
            j["exit_code"] = *job.exit_code;
        }
        if( job.state == Job_State::FAILED ){
            j["reason"] = job.reason;
        }
        if( job.pid.has_value() ){
            j["pid"] = *job.pid;
        }
        if( job.started_at.has_value() ){
            j["started_at"] = to_micros(*job.started_at);
        }
        if( job.finished_at.has_value() ){
            j["finished_at"] = to_micros(*job.finished_at);
        }
        if( with_output ){
            j["stdout"] = job.output.std_out;
            j["stderr"] = job.output.std_err;
        }
        return j;
    }

    Job job_from_json(json const& j)
    {
        auto constexpr K = Error_Kind::PROTOCOL_ERROR;
        if( !j.is_object() ){
            throw Error(K, "Job is not an object.");
        }
        Job job;
        job.id = unsigned_field(j, "id", K);
        job.cmdline = string_field(j, "cmdline", K);
        auto state = job_state_from_string(string_field(j, "status", K));
        if( !state.has_value() ){
            throw Error(K, fmt::format("Unknown job status `{}`.", j["status"].get<std::string>()));
        }
        job.state = *state;
        job.submitted_at = from_micros(optional_integer_field(j, "submitted_at", K).value_or(0));
        if( auto d = optional_integer_field(j, "expected_duration", K) ){
            job.expected_duration = Seconds(*d);
        }
        job.notify_cmd = optional_string_field(j, "notify_cmd", K);
        if( auto code = optional_integer_field(j, "exit_code", K) ){
            job.exit_code = static_cast<int>(*code);
        }
        job.reason = optional_string_field(j, "reason", K).value_or("");
        if( auto pid = optional_integer_field(j, "pid", K) ){
            job.pid = static_cast<pid_t>(*pid);
        }
        job.started_at = optional_time_field(j, "started_at");
        job.finished_at = optional_time_field(j, "finished_at");
        job.output.std_out = optional_string_field(j, "stdout", K).value_or("");
        job.output.std_err = optional_string_field(j, "stderr", K).value_or("");
        return job;
    }

    std::string encode_request(Request const& request)
    {
        json j = std::visit(Overloaded{
            [](Submit_Request const& r){
                json o{{"type", "submit"}, {"cmdline", r.cmdline}};
                if( r.expected_duration.has_value() ){
                    o["expected_duration"] = r.expected_duration->count();
                }
                if( r.notify_cmd.has_value() ){
                    o["notify_cmd"] = *r.notify_cmd;
                }
                return o;
            },
            [](Queue_Status_Request const&){
                return json{{"type", "queue_status"}};
            },
            [](Remove_Request const& r){
                return json{{"type", "remove"}, {"job_id", r.job_id}};
            },
            [](Kill_Request const& r){
                return json{{"type", "kill"}, {"job_id", r.job_id}};
            },
            [](Pause_Request const&){
                return json{{"type", "pause"}};
            },
            [](Resume_Request const&){
                return json{{"type", "resume"}};
            }
        }, request);
        return dump(j);
    }

    Request decode_request(std::string const& document)
    {
        auto j = parse_object(document);
        auto type = j["type"].get<std::string>();
        auto constexpr K = Error_Kind::INVALID_REQUEST;
        if( type == "submit" ){
            Submit_Request r;
            r.cmdline = string_field(j, "cmdline", K);
            if( auto d = optional_integer_field(j, "expected_duration", K) ){
                if( *d < 0 ){
                    throw Error(K, "Field `expected_duration` must not be negative.");
                }
                r.expected_duration = Seconds(*d);
            }
            r.notify_cmd = optional_string_field(j, "notify_cmd", K);
            return r;
        }
        if( type == "queue_status" ){
            return Queue_Status_Request{};
        }
        if( type == "remove" ){
            return Remove_Request{unsigned_field(j, "job_id", K)};
        }
        if( type == "kill" ){
            return Kill_Request{unsigned_field(j, "job_id", K)};
        }
        if( type == "pause" ){
            return Pause_Request{};
        }
        if( type == "resume" ){
            return Resume_Request{};
        }
        throw Error(Error_Kind::PROTOCOL_ERROR, fmt::format("Unknown request type `{}`.", type));
    }

    std::string encode_response(Response const& response)
    {
        json j = std::visit(Overloaded{
            [](Submit_Response const& r){
                return json{{"type", "submit"}, {"job_id", r.job_id}};
            },
            [](Queue_Status_Response const& r){
                json jobs = json::array();
                for( auto const& job : r.jobs ){
                    jobs.push_back(job_to_json(job));
                }
                return json{{"type", "queue_status"}, {"jobs", jobs}, {"state", to_string(r.state)}};
            },
            [](Job_Response const& r){
                return json{{"type", "job"}, {"job", job_to_json(r.job)}};
            },
            [](Ok_Response const&){
                return json{{"type", "ok"}};
            },
            [](Queue_State_Response const& r){
                return json{{"type", "queue_state"}, {"state", to_string(r.state)}};
            },
            [](Error_Response const& r){
                return json{{"type", "error"}, {"kind", to_string(r.kind)}, {"message", r.message}};
            }
        }, response);
        return dump(j);
    }

    Response decode_response(std::string const& document)
    {
        auto j = parse_object(document);
        auto type = j["type"].get<std::string>();
        auto constexpr K = Error_Kind::PROTOCOL_ERROR;
        if( type == "submit" ){
            return Submit_Response{unsigned_field(j, "job_id", K)};
        }
        if( type == "queue_status" ){
            auto const& jobs = field(j, "jobs", K);
            if( !jobs.is_array() ){
                throw Error(K, "Field `jobs` must be an array.");
            }
            Queue_Status_Response r;
            for( auto const& job : jobs ){
                r.jobs.push_back(job_from_json(job));
            }
            r.state = queue_state_field(j, "state");
            return r;
        }
        if( type == "job" ){
            return Job_Response{job_from_json(field(j, "job", K))};
        }
        if( type == "ok" ){
            return Ok_Response{};
        }
        if( type == "queue_state" ){
            return Queue_State_Response{queue_state_field(j, "state")};
        }
        if( type == "error" ){
            auto name = string_field(j, "kind", K);
            auto kind = error_kind_from_string(name);
            if( !kind.has_value() ){
                throw Error(K, fmt::format("Unknown error kind `{}`.", name));
            }
            return Error_Response{*kind, string_field(j, "message", K)};
        }
        throw Error(K, fmt::format("Unknown response type `{}`.", type));
    }

    std::string encode_notify_payload(Job const& job)
    {
        return dump(job_to_json(job, false));
    }

    void write_frame(Stream& stream, std::string const& payload)
    {
        if( payload.size() > 0xffffffffULL ){
            throw Error(Error_Kind::PROTOCOL_ERROR, "Payload does not fit in a frame.");
        }
        auto size = static_cast<std::uint32_t>(payload.size());
        std::array<char, 4> header;
        for( std::size_t i = 0; i < header.size(); ++i ){
            header[i] = static_cast<char>((size >> (8 * i)) & 0xff);
        }
        std::string frame(header.data(), header.size());
        frame += payload;
        stream.write_all(frame.data(), frame.size());
    }

    std::optional<std::string> read_frame(Stream& stream, std::size_t max_size)
    {
        std::array<unsigned char, 4> header;
        auto n = stream.read_exact(reinterpret_cast<char*>(header.data()), header.size());
        if( n == 0 ){
            return std::nullopt;
        }
        if( n < header.size() ){
            throw Error(Error_Kind::PROTOCOL_ERROR, "Connection closed inside a frame header.");
        }
        std::uint32_t size = 0;
        for( std::size_t i = 0; i < header.size(); ++i ){
            size |= static_cast<std::uint32_t>(header[i]) << (8 * i);
        }
        if( size > max_size ){
            throw Error(Error_Kind::PROTOCOL_ERROR, fmt::format("Frame of {} bytes exceeds the limit of {}.", size, max_size));
        }
        std::string payload(size, '\0');
        if( stream.read_exact(payload.data(), size) < size ){
            throw Error(Error_Kind::PROTOCOL_ERROR, "Connection closed inside a frame.");
        }
        return payload;
    }
}
