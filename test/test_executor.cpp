#include "command_line.hpp"
#include "error.hpp"
#include "executor.hpp"
#include "queue.hpp"
#include "slurp.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace QManager{
    namespace{
        using namespace std::chrono_literals;

        // Polls the queue until pred holds for its snapshot or 10 s passed.
        bool wait_for(Queue const& queue, std::function<bool(std::vector<Job> const&)> const& pred){
            for( int i = 0; i < 1000; ++i ){
                if( pred(queue.snapshot()) ){
                    return true;
                }
                std::this_thread::sleep_for(10ms);
            }
            return false;
        }

        bool all_terminal(std::vector<Job> const& jobs){
            for( auto const& job : jobs ){
                if( !job.is_terminal() ){
                    return false;
                }
            }
            return true;
        }

        class Temp_File{
        private:
            std::string _path;
        public:
            Temp_File(){
                std::string pattern = ::testing::TempDir() + "qmanager_XXXXXX";
                int fd = mkstemp(pattern.data());
                if( fd < 0 ){
                    throw system_error(Error_Kind::IO_ERROR, "mkstemp() failed", errno);
                }
                ::close(fd);
                _path = pattern;
            }
            ~Temp_File(){
                std::remove(_path.c_str());
            }
            std::string const& path() const{
                return _path;
            }
        };

        // A zombie counts as gone.
        bool alive(pid_t pid){
            std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
            std::string line;
            if( !std::getline(stat, line) ){
                return false;
            }
            auto state = line.find(") ");
            return state != std::string::npos && line[state + 2] != 'Z' && line[state + 2] != 'X';
        }

        std::string append_to(std::string const& file){
            return join_command_line({"sh", "-c", "cat >> \"$0\"", file});
        }
    }

    TEST(Executor, CompletedJobCarriesExitCodeAndOutput){
        Queue queue;
        Executor executor(queue, {});
        auto id = queue.submit("echo hi");
        ASSERT_TRUE(executor.run_next());
        EXPECT_FALSE(executor.run_next());

        auto job = queue.snapshot().front();
        EXPECT_EQ(job.id, id);
        EXPECT_EQ(job.state, Job_State::COMPLETED);
        EXPECT_EQ(job.exit_code, 0);
        ASSERT_TRUE(job.started_at.has_value());
        ASSERT_TRUE(job.finished_at.has_value());
        EXPECT_GT(*job.finished_at, *job.started_at);
        EXPECT_EQ(job.output.std_out, "hi\n");
        EXPECT_FALSE(job.pid.has_value());
    }

    TEST(Executor, NonZeroExitIsStillCompleted){
        Queue queue;
        Executor executor(queue, {});
        queue.submit("sh -c 'echo oops >&2; exit 3'");
        executor.run_next();
        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::COMPLETED);
        EXPECT_EQ(job.exit_code, 3);
        EXPECT_EQ(job.output.std_err, "oops\n");
    }

    TEST(Executor, LaunchFailureFailsTheJob){
        Queue queue;
        Executor executor(queue, {});
        queue.submit("/nonexistent/qmanager/program --flag");
        executor.run_next();
        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::FAILED);
        EXPECT_FALSE(job.exit_code.has_value());
        EXPECT_EQ(job.reason.rfind("failed to launch", 0), 0u) << job.reason;
        EXPECT_FALSE(queue.running().has_value());
    }

    TEST(Executor, SignalDeathFailsTheJob){
        Queue queue;
        Executor executor(queue, {});
        queue.submit("sh -c 'kill -TERM $$'");
        executor.run_next();
        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::FAILED);
        EXPECT_NE(job.reason.find("signal 15"), std::string::npos) << job.reason;
    }

    TEST(Executor, OutputIsLimited){
        Queue queue;
        Executor_Settings settings;
        settings.output_limit = 10;
        Executor executor(queue, settings);
        queue.submit("sh -c 'printf 0123456789abcdef; printf xy >&2'");
        executor.run_next();
        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::COMPLETED);
        EXPECT_EQ(job.output.std_out, "0123456789");
        EXPECT_EQ(job.output.std_err, "xy");
    }

    TEST(Executor, WorkingDirectoryAndAppkeys){
        Queue queue;
        Executor_Settings settings;
        settings.working_directory = "/";
        settings.appkeys = {{"where", "pwd"}, {"say", "echo"}};
        Executor executor(queue, settings);

        EXPECT_NO_THROW(executor.validate("say hello", std::nullopt));
        EXPECT_THROW(executor.validate("rm -rf /", std::nullopt), Error);

        queue.submit("where");
        queue.submit("say hello");
        executor.run_next();
        executor.run_next();
        auto jobs = queue.snapshot();
        EXPECT_EQ(jobs[0].output.std_out, "/\n");
        EXPECT_EQ(jobs[1].output.std_out, "hello\n");
    }

    TEST(Executor, JobsRunInSubmissionOrderOneAtATime){
        Queue queue;
        Executor executor(queue, {});
        executor.start();
        auto j1 = queue.submit("sleep 0.2");
        auto j2 = queue.submit("true");

        bool overlap = false;
        EXPECT_TRUE(wait_for(queue, [&overlap](std::vector<Job> const& jobs){
            int running = 0;
            for( auto const& job : jobs ){
                running += job.state == Job_State::RUNNING;
            }
            overlap = overlap || running > 1;
            return all_terminal(jobs);
        }));
        executor.stop();
        EXPECT_FALSE(overlap);

        auto jobs = queue.snapshot();
        ASSERT_EQ(jobs.size(), 2u);
        EXPECT_EQ(jobs[0].id, j1);
        EXPECT_EQ(jobs[1].id, j2);
        EXPECT_LE(*jobs[0].started_at, *jobs[1].started_at);
        EXPECT_GE(*jobs[1].started_at, *jobs[0].finished_at);
    }

    TEST(Executor, NotifyCommandGetsOneDocument){
        Temp_File file;
        Queue queue;
        Executor_Settings settings;
        settings.allow_notify = true;
        Executor executor(queue, settings);

        auto notify = append_to(file.path());
        executor.validate("sh -c 'exit 4'", notify);
        auto id = queue.submit("sh -c 'exit 4'", Seconds(1), notify);
        executor.run_next();
        executor.stop();

        auto payload = nlohmann::json::parse(slurp(file.path()));
        EXPECT_EQ(payload["id"], id);
        EXPECT_EQ(payload["status"], "completed");
        EXPECT_EQ(payload["exit_code"], 4);
        EXPECT_EQ(payload["expected_duration"], 1);
        EXPECT_FALSE(payload.contains("stdout"));
    }

    TEST(Executor, NotifyIsRejectedWhenDisabled){
        Queue queue;
        Executor executor(queue, {});
        try{
            executor.validate("true", std::string("cat"));
            ADD_FAILURE() << "notify command accepted";
        }
        catch( Error const& e ){
            EXPECT_EQ(e.kind(), Error_Kind::INVALID_REQUEST);
        }
    }

    TEST(Executor, OperatorNotifyRunsForEveryJob){
        Temp_File file;
        Queue queue;
        Executor_Settings settings;
        settings.notify_command = append_to(file.path());
        Executor executor(queue, settings);

        queue.submit("true");
        queue.submit("/nonexistent/qmanager/program");
        executor.run_next();
        // Sequential notifiers keep the appended documents apart.
        executor.stop();
        executor.run_next();
        executor.stop();

        auto content = slurp(file.path());
        auto split = content.find("}{");
        ASSERT_NE(split, std::string::npos) << content;
        auto first = nlohmann::json::parse(content.substr(0, split + 1));
        auto second = nlohmann::json::parse(content.substr(split + 1));
        EXPECT_EQ(first["status"], "completed");
        EXPECT_EQ(second["status"], "failed");
        EXPECT_TRUE(second["reason"].is_string());
    }

    TEST(Executor, FailingNotifyDoesNotTouchTheJob){
        Queue queue;
        Executor_Settings settings;
        settings.notify_command = "/nonexistent/qmanager/notifier";
        Executor executor(queue, settings);
        queue.submit("true");
        executor.run_next();
        executor.stop();
        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::COMPLETED);
        EXPECT_EQ(job.exit_code, 0);
    }

    TEST(Executor, TerminateStopsTheRunningJob){
        Queue queue;
        Executor executor(queue, {});
        executor.start();
        auto id = queue.submit("sleep 30");
        ASSERT_TRUE(wait_for(queue, [](std::vector<Job> const& jobs){
            return jobs.front().pid.has_value();
        }));
        executor.terminate(id);
        ASSERT_TRUE(wait_for(queue, all_terminal));
        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::FAILED);
        EXPECT_NE(job.reason.find("signal 15"), std::string::npos) << job.reason;

        try{
            executor.terminate(id);
            ADD_FAILURE() << "terminated a finished job";
        }
        catch( Error const& e ){
            EXPECT_EQ(e.kind(), Error_Kind::INVALID_TRANSITION);
        }
        executor.stop();
    }

    TEST(Executor, StopTerminatesTheRunningJob){
        Queue queue;
        Executor executor(queue, {});
        executor.start();
        queue.submit("sleep 30");
        queue.submit("true");
        ASSERT_TRUE(wait_for(queue, [](std::vector<Job> const& jobs){
            return jobs.front().pid.has_value();
        }));
        auto begin = std::chrono::steady_clock::now();
        executor.stop();
        EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);

        auto jobs = queue.snapshot();
        EXPECT_EQ(jobs[0].state, Job_State::FAILED);
        EXPECT_EQ(jobs[1].state, Job_State::QUEUED);
    }

    TEST(Executor, JobEndsWhenItsProcessExitsDespiteBackgroundChild){
        Queue queue;
        Executor executor(queue, {});
        queue.submit("sh -c 'sleep 30 & echo $!; exit 0'");
        auto begin = std::chrono::steady_clock::now();
        ASSERT_TRUE(executor.run_next());
        EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);

        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::COMPLETED);
        EXPECT_EQ(job.exit_code, 0);
        EXPECT_FALSE(queue.running().has_value());
        pid_t child = std::stoi(job.output.std_out);
        EXPECT_TRUE(alive(child));
        ::kill(child, SIGKILL);
    }

    TEST(Executor, NextJobRunsWhileBackgroundChildLives){
        Queue queue;
        Executor executor(queue, {});
        executor.start();
        queue.submit("sh -c 'sleep 30 & echo $!'");
        queue.submit("echo next");
        ASSERT_TRUE(wait_for(queue, all_terminal));
        executor.stop();

        auto jobs = queue.snapshot();
        EXPECT_EQ(jobs[0].state, Job_State::COMPLETED);
        EXPECT_EQ(jobs[1].state, Job_State::COMPLETED);
        EXPECT_EQ(jobs[1].output.std_out, "next\n");
        ::kill(std::stoi(jobs[0].output.std_out), SIGKILL);
    }

    TEST(Executor, TerminateReachesTheWholeProcessGroup){
        Queue queue;
        Executor executor(queue, {});
        executor.start();
        auto id = queue.submit("sh -c 'sleep 30 & echo $!; wait'");
        ASSERT_TRUE(wait_for(queue, [](std::vector<Job> const& jobs){
            return jobs.front().pid.has_value();
        }));
        // Give the shell time to start its child.
        std::this_thread::sleep_for(200ms);
        executor.terminate(id);
        ASSERT_TRUE(wait_for(queue, all_terminal));
        executor.stop();

        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::FAILED);
        EXPECT_NE(job.reason.find("signal 15"), std::string::npos) << job.reason;
        pid_t child = std::stoi(job.output.std_out);
        bool gone = false;
        for( int i = 0; i < 100 && !gone; ++i ){
            gone = !alive(child);
            std::this_thread::sleep_for(10ms);
        }
        EXPECT_TRUE(gone);
    }

    TEST(Executor, StopReturnsWhenTheJobLeftAChildBehind){
        Queue queue;
        Executor executor(queue, {});
        executor.start();
        queue.submit("sh -c 'sleep 30 & sleep 30'");
        ASSERT_TRUE(wait_for(queue, [](std::vector<Job> const& jobs){
            return jobs.front().pid.has_value();
        }));
        std::this_thread::sleep_for(200ms);
        auto begin = std::chrono::steady_clock::now();
        executor.stop();
        EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
        EXPECT_FALSE(queue.running().has_value());
        EXPECT_EQ(queue.snapshot().front().state, Job_State::FAILED);
    }

    TEST(Executor, StopKillsJobsIgnoringTerminate){
        Queue queue;
        Executor executor(queue, {});
        executor.start();
        queue.submit("sh -c 'trap \"\" TERM; sleep 30 & wait'");
        ASSERT_TRUE(wait_for(queue, [](std::vector<Job> const& jobs){
            return jobs.front().pid.has_value();
        }));
        std::this_thread::sleep_for(200ms);
        auto begin = std::chrono::steady_clock::now();
        executor.stop();
        EXPECT_LT(std::chrono::steady_clock::now() - begin, 15s);
        auto job = queue.snapshot().front();
        EXPECT_EQ(job.state, Job_State::FAILED);
        EXPECT_NE(job.reason.find("signal 9"), std::string::npos) << job.reason;
    }

    TEST(Executor, RunnerOutlivesFailingNotifiers){
        Queue queue;
        Executor_Settings settings;
        settings.notify_command = "/nonexistent/qmanager/notifier";
        Executor executor(queue, settings);
        executor.start();
        for( int i = 0; i < 5; ++i ){
            queue.submit("true");
        }
        ASSERT_TRUE(wait_for(queue, all_terminal));
        executor.stop();
        for( auto const& job : queue.snapshot() ){
            EXPECT_EQ(job.state, Job_State::COMPLETED);
        }
    }
}
