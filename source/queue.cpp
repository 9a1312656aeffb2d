#include "command_line.hpp"
#include "error.hpp"
#include "log.hpp"
#include "queue.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <utility>

namespace QManager{
    namespace{
        // Timestamps of one job never go backwards, even if the wall clock does.
        Time_Point stamp_after(Time_Point const& previous, bool strictly){
            auto t = now();
            if( strictly && t <= previous ){
                return previous + Micros(1);
            }
            return std::max(t, previous);
        }

        void log_evicted(std::vector<Job_Id> const& ids){
            for( auto id : ids ){
                log(fmt::format("Job {} evicted from retention.", id), Message_Type::DEBUG);
            }
        }
    }

    Queue::Queue(std::size_t max_finished)
    : _last_id(0)
    , _state(Queue_State::RUNNING)
    , _n_finished(0)
    , _max_finished(max_finished)
    , _shut_down(false)
    {}

    std::deque<Job>::iterator Queue::_find(Job_Id id){
        auto it = std::lower_bound(_jobs.begin(), _jobs.end(), id, [](Job const& job, Job_Id value){
            return job.id < value;
        });
        if( it == _jobs.end() || it->id != id ){
            throw Error(Error_Kind::NOT_FOUND, fmt::format("No job with id {}.", id));
        }
        return it;
    }

    std::deque<Job>::const_iterator Queue::_find(Job_Id id) const{
        return const_cast<Queue*>(this)->_find(id);
    }

    Job& Queue::_running_job(Job_Id id){
        auto& job = *_find(id);
        if( job.state != Job_State::RUNNING ){
            throw Error(Error_Kind::INVALID_TRANSITION,
                        fmt::format("Job {} is {}, not running.", id, to_string(job.state)));
        }
        return job;
    }

    bool Queue::_can_start() const{
        return _state == Queue_State::RUNNING
            && !_running.has_value()
            && std::any_of(_jobs.begin(), _jobs.end(), [](Job const& job){
                return job.state == Job_State::QUEUED;
            });
    }

    Job_Id Queue::submit(std::string const& cmdline, std::optional<Seconds> expected_duration,
                         std::optional<std::string> notify_cmd)
    {
        if( split_command_line(cmdline).empty() ){
            throw Error(Error_Kind::INVALID_REQUEST, "Command line is empty.");
        }
        if( expected_duration.has_value() && expected_duration->count() < 0 ){
            throw Error(Error_Kind::INVALID_REQUEST, "Expected duration is negative.");
        }
        if( notify_cmd.has_value() && split_command_line(*notify_cmd).empty() ){
            throw Error(Error_Kind::INVALID_REQUEST, "Notify command is empty.");
        }
        Job job;
        job.cmdline = cmdline;
        job.expected_duration = expected_duration;
        job.notify_cmd = std::move(notify_cmd);
        job.submitted_at = now();
        {
            std::lock_guard<std::mutex> lock(_mutex);
            job.id = ++_last_id;
            _jobs.push_back(job);
        }
        _work_available.notify_all();
        log(fmt::format("Job {} queued: `{}`", job.id, job.cmdline));
        return job.id;
    }

    std::vector<Job> Queue::snapshot() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return std::vector<Job>(_jobs.begin(), _jobs.end());
    }

    std::size_t Queue::size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _jobs.size();
    }

    std::optional<Job> Queue::try_start_next()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if( _state != Queue_State::RUNNING || _running.has_value() ){
            return std::nullopt;
        }
        auto it = std::find_if(_jobs.begin(), _jobs.end(), [](Job const& job){
            return job.state == Job_State::QUEUED;
        });
        if( it == _jobs.end() ){
            return std::nullopt;
        }
        it->state = Job_State::RUNNING;
        it->started_at = stamp_after(it->submitted_at, false);
        _running = it->id;
        return *it;
    }

    Job Queue::_finish(Job& job, Job_State state, Job_Output output, std::vector<Job_Id>& evicted){
        job.state = state;
        job.finished_at = stamp_after(job.started_at.value_or(job.submitted_at), true);
        job.pid.reset();
        job.output = std::move(output);
        _running.reset();
        ++_n_finished;
        Job finished = job;
        evicted = _evict_finished();
        return finished;
    }

    Job Queue::complete_job(Job_Id id, int exit_code, Job_Output output)
    {
        Job finished;
        std::vector<Job_Id> evicted;
        bool stopped = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto& job = _running_job(id);
            job.exit_code = exit_code;
            finished = _finish(job, Job_State::COMPLETED, std::move(output), evicted);
            stopped = _settle_state();
        }
        _work_available.notify_all();
        log_evicted(evicted);
        if( stopped ){
            log("Queue stopped.");
        }
        return finished;
    }

    Job Queue::fail_job(Job_Id id, std::string const& reason, Job_Output output)
    {
        Job finished;
        std::vector<Job_Id> evicted;
        bool stopped = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto& job = _running_job(id);
            job.reason = reason;
            finished = _finish(job, Job_State::FAILED, std::move(output), evicted);
            stopped = _settle_state();
        }
        _work_available.notify_all();
        log_evicted(evicted);
        if( stopped ){
            log("Queue stopped.");
        }
        return finished;
    }

    std::vector<Job_Id> Queue::_evict_finished(){
        std::vector<Job_Id> evicted;
        if( _max_finished == 0 ){
            return evicted;
        }
        while( _n_finished > _max_finished ){
            auto it = std::find_if(_jobs.begin(), _jobs.end(), [](Job const& job){
                return job.is_terminal();
            });
            if( it == _jobs.end() ){
                break;
            }
            evicted.push_back(it->id);
            _jobs.erase(it);
            --_n_finished;
        }
        return evicted;
    }

    void Queue::assign_pid(Job_Id id, std::optional<pid_t> pid)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _running_job(id).pid = pid;
    }

    void Queue::signal_job(Job_Id id, int signal) const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto const& job = *_find(id);
        if( job.state != Job_State::RUNNING || !job.pid.has_value() ){
            throw Error(Error_Kind::INVALID_TRANSITION, fmt::format("Job {} is currently not running.", id));
        }
        if( ::kill(-*job.pid, signal) < 0 && ::kill(*job.pid, signal) < 0 ){
            throw system_error(Error_Kind::PROCESS_ERROR, fmt::format("Cannot signal job {}", id), errno);
        }
    }

    std::optional<Job_Id> Queue::running() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _running;
    }

    Job Queue::remove(Job_Id id)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _find(id);
        if( !it->is_terminal() ){
            throw Error(Error_Kind::INVALID_TRANSITION,
                        fmt::format("Job {} is {} and cannot be removed.", id, to_string(it->state)));
        }
        Job removed = *it;
        _jobs.erase(it);
        --_n_finished;
        return removed;
    }

    bool Queue::_settle_state(){
        if( _state == Queue_State::STOPPING && !_running.has_value() ){
            _state = Queue_State::STOPPED;
            return true;
        }
        return false;
    }

    Queue_State Queue::state() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state;
    }

    Queue_State Queue::pause()
    {
        Queue_State state;
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if( _state == Queue_State::RUNNING ){
                _state = Queue_State::STOPPING;
                _settle_state();
                changed = true;
            }
            state = _state;
        }
        if( changed ){
            log(fmt::format("Queue {}.", to_string(state)));
        }
        return state;
    }

    Queue_State Queue::resume()
    {
        bool changed;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            changed = _state != Queue_State::RUNNING;
            _state = Queue_State::RUNNING;
        }
        _work_available.notify_all();
        if( changed ){
            log("Queue resumed.");
        }
        return Queue_State::RUNNING;
    }

    bool Queue::wait_for_work()
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _work_available.wait(lock, [this](){
            return _shut_down || _can_start();
        });
        return !_shut_down;
    }

    void Queue::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _shut_down = true;
        }
        _work_available.notify_all();
    }
}
