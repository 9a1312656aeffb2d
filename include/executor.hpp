#ifndef QMANAGER_EXECUTOR_HPP
#define QMANAGER_EXECUTOR_HPP

#include "command_line.hpp"
#include "job.hpp"
#include "queue.hpp"

#include <atomic>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace QManager
{
    struct Executor_Settings
    {
        Appkeys appkeys;
        // Client supplied notify commands run server side with the daemon's
        // privileges. Off by default; likely to be removed.
        bool allow_notify = false;
        // Operator configured command run for every finished job.
        std::optional<std::string> notify_command;
        std::size_t output_limit = 64 * 1024;
        std::string working_directory = "/";
    };

    /*
     * Runs the jobs released by the queue, one at a time, and resolves each to
     * a terminal state. Notify commands run on their own threads.
     */
    class Executor
    {
    private:
        struct Notifier
        {
            std::thread thread;
            std::atomic<bool> done{false};
        };

        Queue& _queue;
        Executor_Settings _settings;
        std::thread _thread;
        std::mutex _notifier_mutex;
        std::list<Notifier> _notifiers;
        std::atomic<bool> _started;

        void _loop();
        Job _execute(Job const& job);
        void _notify(Job const& job);
        void _run_notify_command(Job_Id id, std::string const& command, std::string const& payload);
        void _reap_notifiers(bool all);
    public:
        Executor(Queue& queue, Executor_Settings settings);
        ~Executor();
        Executor(Executor const&) = delete;
        Executor& operator=(Executor const&) = delete;

        // Throws INVALID_REQUEST if a submission could never run here.
        void validate(std::string const& cmdline, std::optional<std::string> const& notify_cmd) const;

        // Runs the next job to completion on the calling thread. Returns false if
        // no job could be started.
        bool run_next();

        void start();
        // Shuts the queue down, terminates the running job and joins all threads.
        void stop();

        // Sends SIGTERM to a running job.
        void terminate(Job_Id id);
    };
}

#endif //QMANAGER_EXECUTOR_HPP
