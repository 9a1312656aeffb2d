#ifndef QMANAGER_QUEUE_HPP
#define QMANAGER_QUEUE_HPP

#include "job.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace QManager
{
    /*
     * Authoritative store of all jobs. Every operation runs under one mutex and
     * never blocks on I/O while holding it.
     *
     * Jobs are kept in submission order. Because jobs run one at a time in FIFO
     * order, the sequence is always: terminal jobs, at most one running job,
     * queued jobs.
     */
    class Queue
    {
    private:
        mutable std::mutex _mutex;
        std::condition_variable _work_available;
        std::deque<Job> _jobs;
        Job_Id _last_id;
        std::optional<Job_Id> _running;
        Queue_State _state;
        std::size_t _n_finished;
        std::size_t _max_finished;
        bool _shut_down;

        std::deque<Job>::iterator _find(Job_Id id);
        std::deque<Job>::const_iterator _find(Job_Id id) const;
        Job& _running_job(Job_Id id);
        Job _finish(Job& job, Job_State state, Job_Output output, std::vector<Job_Id>& evicted);
        // Ids of the dropped jobs, logged by the caller once the lock is released.
        std::vector<Job_Id> _evict_finished();
        bool _can_start() const;
        // STOPPING becomes STOPPED, true if that happened.
        bool _settle_state();
    public:
        // max_finished bounds the retained terminal jobs, 0 keeps all of them.
        explicit Queue(std::size_t max_finished = 0);

        Job_Id submit(std::string const& cmdline, std::optional<Seconds> expected_duration = std::nullopt,
                      std::optional<std::string> notify_cmd = std::nullopt);
        std::vector<Job> snapshot() const;
        std::size_t size() const;

        // Head QUEUED job moved to RUNNING, or nothing if the queue is idle, not
        // RUNNING or a job is already running.
        std::optional<Job> try_start_next();
        Job complete_job(Job_Id id, int exit_code, Job_Output output = {});
        Job fail_job(Job_Id id, std::string const& reason, Job_Output output = {});

        void assign_pid(Job_Id id, std::optional<pid_t> pid);
        // Signals the process group of a running job. The executor clears the
        // pid before reaping, so a recycled pid is never signalled.
        void signal_job(Job_Id id, int signal) const;
        std::optional<Job_Id> running() const;
        Job remove(Job_Id id);

        Queue_State state() const;
        // Stops dispatching. Queued jobs stay queued and a running job is left
        // alone. Returns the resulting state.
        Queue_State pause();
        Queue_State resume();

        // Blocks until try_start_next() would return a job. Returns false once
        // the queue is shut down.
        bool wait_for_work();
        void shutdown();
    };
}
#endif //QMANAGER_QUEUE_HPP
