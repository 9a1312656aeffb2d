#include "error.hpp"
#include "protocol.hpp"
#include "socket.hpp"
#include "stream.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <memory>
#include <string>

#include <sys/socket.h>

namespace QManager{
    namespace{
        Job finished_job(){
            Job job;
            job.id = 7;
            job.cmdline = "echo 'a b'";
            job.expected_duration = Seconds(30);
            job.notify_cmd = "mail-me";
            job.submitted_at = from_micros(1'600'000'000'000'001);
            job.started_at = from_micros(1'600'000'000'500'000);
            job.finished_at = from_micros(1'600'000'001'000'000);
            job.state = Job_State::COMPLETED;
            job.exit_code = 0;
            job.output = {"a b\n", ""};
            return job;
        }

        Error_Kind decode_error(std::string const& document){
            try{
                decode_request(document);
            }
            catch( Error const& e ){
                return e.kind();
            }
            ADD_FAILURE() << "decoded: " << document;
            return Error_Kind::IO_ERROR;
        }

        struct Stream_Pair{
            std::unique_ptr<Stream> a;
            std::unique_ptr<Stream> b;
        };

        Stream_Pair stream_pair(){
            int fds[2];
            if( socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0 ){
                throw system_error(Error_Kind::IO_ERROR, "socketpair() failed", errno);
            }
            return {std::make_unique<Plain_Stream>(File_Descriptor(fds[0]), "a"),
                    std::make_unique<Plain_Stream>(File_Descriptor(fds[1]), "b")};
        }
    }

    TEST(Protocol, RequestsSurviveEncoding){
        Request requests[] = {
            Submit_Request{"echo hi", std::nullopt, std::nullopt},
            Submit_Request{"sleep 10", Seconds(10), std::string("cat >> /tmp/log")},
            Queue_Status_Request{},
            Remove_Request{3},
            Kill_Request{18446744073709551615ULL},
            Pause_Request{},
            Resume_Request{}
        };
        for( auto const& request : requests ){
            EXPECT_EQ(decode_request(encode_request(request)), request);
        }
    }

    TEST(Protocol, ResponsesSurviveEncoding){
        Job queued;
        queued.id = 8;
        queued.cmdline = "true";
        queued.submitted_at = from_micros(1'600'000'002'000'000);
        Job failed = finished_job();
        failed.id = 9;
        failed.state = Job_State::FAILED;
        failed.exit_code.reset();
        failed.reason = "killed by signal 15 (Terminated)";
        Job running = finished_job();
        running.id = 10;
        running.state = Job_State::RUNNING;
        running.exit_code.reset();
        running.finished_at.reset();
        running.pid = 4242;
        running.output = {};

        Response responses[] = {
            Submit_Response{1},
            Queue_Status_Response{},
            Queue_Status_Response{{finished_job(), queued, failed, running}},
            Queue_Status_Response{{queued}, Queue_State::STOPPING},
            Job_Response{finished_job()},
            Ok_Response{},
            Queue_State_Response{Queue_State::STOPPED},
            Error_Response{Error_Kind::NOT_FOUND, "No job with id 3."}
        };
        for( auto const& response : responses ){
            EXPECT_EQ(decode_response(encode_response(response)), response);
        }
    }

    TEST(Protocol, WireShape){
        auto j = nlohmann::json::parse(encode_request(Submit_Request{"echo hi", Seconds(5), std::nullopt}));
        EXPECT_EQ(j["type"], "submit");
        EXPECT_EQ(j["cmdline"], "echo hi");
        EXPECT_EQ(j["expected_duration"], 5);
        EXPECT_FALSE(j.contains("notify_cmd"));

        auto view = job_to_json(finished_job());
        EXPECT_EQ(view["status"], "completed");
        EXPECT_EQ(view["exit_code"], 0);
        EXPECT_EQ(view["submitted_at"], 1'600'000'000'000'001LL);
        EXPECT_EQ(view["stdout"], "a b\n");
        EXPECT_FALSE(view.contains("reason"));
        EXPECT_FALSE(view.contains("pid"));

        auto error = nlohmann::json::parse(encode_response(Error_Response{Error_Kind::INVALID_REQUEST, "empty"}));
        EXPECT_EQ(error["type"], "error");
        EXPECT_EQ(error["kind"], "invalid_request");

        EXPECT_EQ(nlohmann::json::parse(encode_request(Pause_Request{}))["type"], "pause");
        auto state = nlohmann::json::parse(encode_response(Queue_State_Response{Queue_State::STOPPING}));
        EXPECT_EQ(state["type"], "queue_state");
        EXPECT_EQ(state["state"], "stopping");
        auto status = nlohmann::json::parse(encode_response(Queue_Status_Response{{}, Queue_State::STOPPED}));
        EXPECT_EQ(status["state"], "stopped");
    }

    TEST(Protocol, MalformedRequests){
        EXPECT_EQ(decode_error("not json"), Error_Kind::PROTOCOL_ERROR);
        EXPECT_EQ(decode_error("[1, 2]"), Error_Kind::PROTOCOL_ERROR);
        EXPECT_EQ(decode_error(R"({"cmdline": "echo"})"), Error_Kind::PROTOCOL_ERROR);
        EXPECT_EQ(decode_error(R"({"type": "reboot"})"), Error_Kind::PROTOCOL_ERROR);
        EXPECT_EQ(decode_error(R"({"type": "submit"})"), Error_Kind::INVALID_REQUEST);
        EXPECT_EQ(decode_error(R"({"type": "submit", "cmdline": 5})"), Error_Kind::INVALID_REQUEST);
        EXPECT_EQ(decode_error(R"({"type": "submit", "cmdline": "x", "expected_duration": -1})"), Error_Kind::INVALID_REQUEST);
        EXPECT_EQ(decode_error(R"({"type": "kill", "job_id": "one"})"), Error_Kind::INVALID_REQUEST);
        EXPECT_EQ(decode_error(R"({"type": "remove", "job_id": -4})"), Error_Kind::INVALID_REQUEST);
    }

    TEST(Protocol, MalformedResponses){
        EXPECT_THROW(decode_response(R"({"type": "error", "kind": "meltdown", "message": ""})"), Error);
        EXPECT_THROW(decode_response(R"({"type": "queue_status", "jobs": {}})"), Error);
        EXPECT_THROW(decode_response(R"({"type": "queue_status", "jobs": [], "state": "asleep"})"), Error);
        EXPECT_THROW(decode_response(R"({"type": "queue_state"})"), Error);
        EXPECT_THROW(decode_response(R"({"type": "job", "job": {"id": 1, "cmdline": "x", "status": "lost"}})"), Error);
    }

    TEST(Protocol, NotifyPayloadOmitsOutput){
        auto payload = nlohmann::json::parse(encode_notify_payload(finished_job()));
        EXPECT_EQ(payload["id"], 7);
        EXPECT_EQ(payload["status"], "completed");
        EXPECT_EQ(payload["exit_code"], 0);
        EXPECT_EQ(payload["cmdline"], "echo 'a b'");
        EXPECT_TRUE(payload.contains("finished_at"));
        EXPECT_FALSE(payload.contains("stdout"));
        EXPECT_FALSE(payload.contains("stderr"));
    }

    TEST(Protocol, FramesKeepMessagesApart){
        auto [a, b] = stream_pair();
        std::string big(50000, 'x');
        write_frame(*a, encode_request(Queue_Status_Request{}));
        write_frame(*a, big);
        write_frame(*a, "");
        a->shutdown();

        EXPECT_EQ(decode_request(*read_frame(*b)), Request(Queue_Status_Request{}));
        EXPECT_EQ(read_frame(*b), big);
        EXPECT_EQ(read_frame(*b), std::string());
        EXPECT_FALSE(read_frame(*b).has_value());
    }

    TEST(Protocol, OversizedAndTruncatedFrames){
        {
            auto [a, b] = stream_pair();
            write_frame(*a, std::string(1025, 'x'));
            try{
                read_frame(*b, 1024);
                ADD_FAILURE() << "oversized frame accepted";
            }
            catch( Error const& e ){
                EXPECT_EQ(e.kind(), Error_Kind::PROTOCOL_ERROR);
            }
        }
        {
            auto [a, b] = stream_pair();
            char const partial[] = {10, 0, 0, 0, '{', '}'};
            a->write_all(partial, sizeof(partial));
            a->shutdown();
            EXPECT_THROW(read_frame(*b), Error);
        }
        {
            auto [a, b] = stream_pair();
            char const header[] = {1, 0};
            a->write_all(header, sizeof(header));
            a->shutdown();
            EXPECT_THROW(read_frame(*b), Error);
        }
    }
}
