#include "job.hpp"

namespace QManager{
    std::string to_string(Job_State state){
        switch( state ){
            case Job_State::QUEUED:
                return "queued";
            case Job_State::RUNNING:
                return "running";
            case Job_State::COMPLETED:
                return "completed";
            case Job_State::FAILED:
                return "failed";
        }
        return "unknown";
    }

    std::optional<Job_State> job_state_from_string(std::string const& name){
        for( auto state : {Job_State::QUEUED, Job_State::RUNNING, Job_State::COMPLETED, Job_State::FAILED} ){
            if( to_string(state) == name ){
                return state;
            }
        }
        return std::nullopt;
    }

    std::string to_string(Queue_State state){
        switch( state ){
            case Queue_State::RUNNING:
                return "running";
            case Queue_State::STOPPING:
                return "stopping";
            case Queue_State::STOPPED:
                return "stopped";
        }
        return "unknown";
    }

    std::optional<Queue_State> queue_state_from_string(std::string const& name){
        for( auto state : {Queue_State::RUNNING, Queue_State::STOPPING, Queue_State::STOPPED} ){
            if( to_string(state) == name ){
                return state;
            }
        }
        return std::nullopt;
    }

    bool Job::is_terminal() const{
        return state == Job_State::COMPLETED || state == Job_State::FAILED;
    }

    bool operator==(Job_Output const& a, Job_Output const& b){
        return a.std_out == b.std_out && a.std_err == b.std_err;
    }

    bool operator==(Job const& a, Job const& b){
        return a.id == b.id
            && a.cmdline == b.cmdline
            && a.expected_duration == b.expected_duration
            && a.notify_cmd == b.notify_cmd
            && a.submitted_at == b.submitted_at
            && a.started_at == b.started_at
            && a.finished_at == b.finished_at
            && a.state == b.state
            && a.exit_code == b.exit_code
            && a.reason == b.reason
            && a.pid == b.pid
            && a.output == b.output;
    }
}
