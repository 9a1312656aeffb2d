#include "error.hpp"
#include "executor.hpp"
#include "log.hpp"
#include "process.hpp"
#include "protocol.hpp"

#include <fmt/core.h>

#include <chrono>
#include <csignal>
#include <system_error>
#include <utility>
#include <vector>

namespace QManager{
    namespace{
        // 50 ms each, SIGKILL follows SIGTERM after 5 s and is repeated as long
        // as the job is still running.
        int const KILL_AFTER_WAITS = 100;
    }

    Executor::Executor(Queue& queue, Executor_Settings settings)
    : _queue(queue)
    , _settings(std::move(settings))
    , _started(false)
    {
        ignore_sigpipe();
    }

    Executor::~Executor(){
        stop();
    }

    void Executor::validate(std::string const& cmdline, std::optional<std::string> const& notify_cmd) const
    {
        resolve_command(cmdline, _settings.appkeys);
        if( notify_cmd.has_value() ){
            if( !_settings.allow_notify ){
                throw Error(Error_Kind::INVALID_REQUEST, "Notify commands are disabled on this server.");
            }
            if( split_command_line(*notify_cmd).empty() ){
                throw Error(Error_Kind::INVALID_REQUEST, "Notify command is empty.");
            }
        }
    }

    bool Executor::run_next()
    {
        auto job = _queue.try_start_next();
        if( !job.has_value() ){
            return false;
        }
        log(fmt::format("Running job {}: `{}`", job->id, job->cmdline));
        auto finished = _execute(*job);
        _notify(finished);
        return true;
    }

    Job Executor::_execute(Job const& job)
    {
        Process process;
        try{
            auto argv = resolve_command(job.cmdline, _settings.appkeys);
            process.open(argv, {false, true, true}, _settings.working_directory);
        }
        catch( Error const& e ){
            log(fmt::format("Job {} could not be launched: {}", job.id, e.what()), Message_Type::ERROR);
            return _queue.fail_job(job.id, fmt::format("failed to launch: {}", e.what()));
        }
        _queue.assign_pid(job.id, process.pid());
        log(fmt::format("Job {} started as process {}.", job.id, process.pid()), Message_Type::DEBUG);

        Exit_Status status;
        try{
            process.collect_outputs(_settings.output_limit);
            process.wait_for_exit();
            _queue.assign_pid(job.id, std::nullopt);
            status = process.close();
        }
        catch( Error const& e ){
            log(fmt::format("Lost track of job {}: {}", job.id, e.what()), Message_Type::ERROR);
            return _queue.fail_job(job.id, e.what(), {process.out(), process.err()});
        }
        Job_Output output{process.out(), process.err()};
        if( status.reason == Exit_Reason::EXIT ){
            log(fmt::format("Job {} terminated with code {}.", job.id, status.code));
            return _queue.complete_job(job.id, status.code, std::move(output));
        }
        log(fmt::format("Job {} {}.", job.id, describe(status)), Message_Type::WARNING);
        return _queue.fail_job(job.id, describe(status), std::move(output));
    }

    void Executor::_notify(Job const& job)
    {
        std::vector<std::string> commands;
        if( job.notify_cmd.has_value() ){
            if( _settings.allow_notify ){
                commands.push_back(*job.notify_cmd);
            }else{
                log(fmt::format("Ignoring notify command of job {}, notify is disabled.", job.id), Message_Type::WARNING);
            }
        }
        if( _settings.notify_command.has_value() ){
            commands.push_back(*_settings.notify_command);
        }
        if( commands.empty() ){
            return;
        }
        auto payload = encode_notify_payload(job);
        std::lock_guard<std::mutex> lock(_notifier_mutex);
        _reap_notifiers(false);
        for( auto const& command : commands ){
            auto& notifier = _notifiers.emplace_back();
            try{
                notifier.thread = std::thread([this, &notifier, id = job.id, command, payload](){
                    _run_notify_command(id, command, payload);
                    notifier.done = true;
                });
            }
            catch( std::system_error const& e ){
                _notifiers.pop_back();
                log(fmt::format("Notify command `{}` for job {} not started: {}", command, job.id, e.what()), Message_Type::ERROR);
            }
        }
    }

    void Executor::_run_notify_command(Job_Id id, std::string const& command, std::string const& payload)
    {
        try{
            Process process;
            process.open(split_command_line(command), {true, false, false}, _settings.working_directory);
            try{
                process.write_stdin(payload);
            }
            catch( Error const& e ){
                log(fmt::format("Notify command for job {} did not take its input: {}", id, e.what()), Message_Type::WARNING);
            }
            process.wait_for_exit();
            auto status = process.close();
            auto type = status.reason == Exit_Reason::EXIT && status.code == 0 ? Message_Type::DEBUG : Message_Type::WARNING;
            log(fmt::format("Notify command `{}` for job {} {}.", command, id, describe(status)), type);
        }
        catch( Error const& e ){
            log(fmt::format("Notify command `{}` for job {} failed: {}", command, id, e.what()), Message_Type::ERROR);
        }
    }

    void Executor::_reap_notifiers(bool all)
    {
        for( auto it = _notifiers.begin(); it != _notifiers.end(); ){
            if( all || it->done ){
                if( it->thread.joinable() ){
                    it->thread.join();
                }
                it = _notifiers.erase(it);
            }
            else{
                ++it;
            }
        }
    }

    void Executor::start()
    {
        if( _started.exchange(true) ){
            return;
        }
        _thread = std::thread(&Executor::_loop, this);
    }

    void Executor::_loop()
    {
        log("Queue runner started.", Message_Type::DEBUG);
        while( _queue.wait_for_work() ){
            try{
                run_next();
            }
            catch( Error const& e ){
                log(fmt::format("Queue runner: {}", e.what()), Message_Type::ERROR);
            }
            catch( std::system_error const& e ){
                log(fmt::format("Queue runner: {}", e.what()), Message_Type::ERROR);
            }
        }
        log("Queue runner stopped.", Message_Type::DEBUG);
    }

    void Executor::stop()
    {
        using namespace std::chrono_literals;
        _queue.shutdown();
        if( _started ){
            std::optional<Job_Id> terminated;
            int n_waits{0};
            while( auto running = _queue.running() ){
                if( running != terminated ){
                    try{
                        terminate(*running);
                        terminated = running;
                        n_waits = 0;
                    }
                    catch( Error const& e ){
                        log(fmt::format("Cannot stop job {} yet: {}", *running, e.what()), Message_Type::DEBUG);
                    }
                }
                else if( ++n_waits % KILL_AFTER_WAITS == 0 ){
                    log(fmt::format("Job {} ignores SIGTERM, killing it.", *running), Message_Type::WARNING);
                    try{
                        _queue.signal_job(*running, SIGKILL);
                    }
                    catch( Error const& e ){
                        log(e.what(), Message_Type::DEBUG);
                    }
                }
                std::this_thread::sleep_for(50ms);
            }
            if( _thread.joinable() ){
                _thread.join();
            }
            _started = false;
        }
        std::list<Notifier> notifiers;
        {
            std::lock_guard<std::mutex> lock(_notifier_mutex);
            notifiers.splice(notifiers.end(), _notifiers);
        }
        for( auto& notifier : notifiers ){
            if( notifier.thread.joinable() ){
                notifier.thread.join();
            }
        }
    }

    void Executor::terminate(Job_Id id)
    {
        _queue.signal_job(id, SIGTERM);
        log(fmt::format("Job {} asked to terminate.", id));
    }
}
