#ifndef QMANAGER_PROTOCOL_HPP
#define QMANAGER_PROTOCOL_HPP

#include "error.hpp"
#include "job.hpp"
#include "stream.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace QManager{
    /*
        Frame on the connection

        # header
            uint32 little endian: payload length
        # payload
            UTF-8 JSON document, an object with a "type" member

        Requests:  submit, queue_status, remove, kill, pause, resume
        Responses: submit, queue_status, job, ok, queue_state, error
     */
    std::uint16_t const DEFAULT_PORT = 1337;
    // Bounds requests read by the daemon. Responses are only bounded by the header.
    std::size_t const DEFAULT_MAX_FRAME_SIZE = 16 * 1024 * 1024;
    std::size_t const MAX_FRAME_SIZE = 0xffffffff;

    struct Submit_Request{
        std::string cmdline;
        std::optional<Seconds> expected_duration;
        std::optional<std::string> notify_cmd;
    };
    struct Queue_Status_Request{};
    struct Remove_Request{
        Job_Id job_id;
    };
    struct Kill_Request{
        Job_Id job_id;
    };
    struct Pause_Request{};
    struct Resume_Request{};
    using Request = std::variant<Submit_Request, Queue_Status_Request, Remove_Request, Kill_Request,
                                 Pause_Request, Resume_Request>;

    struct Submit_Response{
        Job_Id job_id;
    };
    struct Queue_Status_Response{
        std::vector<Job> jobs;
        Queue_State state = Queue_State::RUNNING;
    };
    struct Job_Response{
        Job job;
    };
    struct Ok_Response{};
    struct Queue_State_Response{
        Queue_State state;
    };
    struct Error_Response{
        Error_Kind kind;
        std::string message;
    };
    using Response = std::variant<Submit_Response, Queue_Status_Response, Job_Response, Ok_Response,
                                  Queue_State_Response, Error_Response>;

    bool operator==(Submit_Request const& a, Submit_Request const& b);
    bool operator==(Queue_Status_Request const& a, Queue_Status_Request const& b);
    bool operator==(Remove_Request const& a, Remove_Request const& b);
    bool operator==(Kill_Request const& a, Kill_Request const& b);
    bool operator==(Pause_Request const& a, Pause_Request const& b);
    bool operator==(Resume_Request const& a, Resume_Request const& b);
    bool operator==(Submit_Response const& a, Submit_Response const& b);
    bool operator==(Queue_Status_Response const& a, Queue_Status_Response const& b);
    bool operator==(Job_Response const& a, Job_Response const& b);
    bool operator==(Ok_Response const& a, Ok_Response const& b);
    bool operator==(Queue_State_Response const& a, Queue_State_Response const& b);
    bool operator==(Error_Response const& a, Error_Response const& b);

    nlohmann::json job_to_json(Job const& job, bool with_output = true);
    Job job_from_json(nlohmann::json const& j);

    std::string encode_request(Request const& request);
    // PROTOCOL_ERROR if the document or its type cannot be identified,
    // INVALID_REQUEST if a known request carries bad fields.
    Request decode_request(std::string const& document);

    std::string encode_response(Response const& response);
    Response decode_response(std::string const& document);

    // Document written to the standard input of notify commands.
    std::string encode_notify_payload(Job const& job);

    void write_frame(Stream& stream, std::string const& payload);
    // nullopt on a clean end of stream before the header. PROTOCOL_ERROR on a
    // truncated or oversized frame.
    std::optional<std::string> read_frame(Stream& stream, std::size_t max_size = DEFAULT_MAX_FRAME_SIZE);
}

#endif //QMANAGER_PROTOCOL_HPP
