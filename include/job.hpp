#ifndef QMANAGER_JOB_HPP
#define QMANAGER_JOB_HPP

#include "time.hpp"

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace QManager
{
    using Job_Id = std::uint64_t;

    // Forward-only: QUEUED -> RUNNING -> {COMPLETED | FAILED}.
    enum class Job_State
    {
        QUEUED,
        RUNNING,
        COMPLETED,
        FAILED
    };

    std::string to_string(Job_State state);
    std::optional<Job_State> job_state_from_string(std::string const& name);

    // Dispatch state of the whole queue. STOPPING lets the running job finish
    // and becomes STOPPED when it does.
    enum class Queue_State
    {
        RUNNING,
        STOPPING,
        STOPPED
    };

    std::string to_string(Queue_State state);
    std::optional<Queue_State> queue_state_from_string(std::string const& name);

    struct Job_Output
    {
        std::string std_out;
        std::string std_err;
    };

    struct Job
    {
        Job_Id id = 0;
        std::string cmdline;
        std::optional<Seconds> expected_duration;
        std::optional<std::string> notify_cmd;
        Time_Point submitted_at;
        std::optional<Time_Point> started_at;
        std::optional<Time_Point> finished_at;
        Job_State state = Job_State::QUEUED;
        std::optional<int> exit_code;
        std::string reason;
        std::optional<pid_t> pid;
        Job_Output output;

        bool is_terminal() const;
    };

    bool operator==(Job_Output const& a, Job_Output const& b);
    bool operator==(Job const& a, Job const& b);
}

#endif //QMANAGER_JOB_HPP
