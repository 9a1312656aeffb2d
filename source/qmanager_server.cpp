#include "config.hpp"
#include "error.hpp"
#include "executor.hpp"
#include "file_lock.hpp"
#include "log.hpp"
#include "options.hpp"
#include "queue.hpp"
#include "server.hpp"

#include <fmt/core.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>

#include <pthread.h>
#include <unistd.h>

using namespace QManager;

namespace{
    // Runs the daemon until SIGTERM or SIGINT. The signals must already be
    // blocked in every thread.
    void serve(Server& server, Executor& executor, sigset_t const& signals){
        std::atomic<bool> served{false};
        std::thread signal_thread([&server, &served, signals](){
            int signal = 0;
            sigwait(&signals, &signal);
            if( !served ){
                log(fmt::format("Received signal {} ({}).", signal, strsignal(signal)));
                server.stop();
            }
        });
        try{
            executor.start();
            server.run();
        }
        catch( Error const& e ){
            log(e.what(), Message_Type::ERROR);
        }
        served = true;
        pthread_kill(signal_thread.native_handle(), SIGTERM);
        signal_thread.join();
        executor.stop();
    }
}

int main(int argc, char** argv){
    std::vector<Tool_Option> const tool_options;
    Config config;
    try{
        auto options = parse_options(argc, argv, tool_options);
        if( options.help ){
            std::cout << usage("qmanager_server", "", tool_options);
            return EXIT_SUCCESS;
        }
        if( !options.arguments.empty() ){
            throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("Unexpected argument: {}", options.arguments.front()));
        }
        config = load_config(options);
        validate_daemon_config(config);
    }
    catch( Error const& e ){
        std::cerr << "qmanager_server: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    std::ofstream log_stream;
    if( config.log_file.has_value() ){
        log_stream.open(*config.log_file, std::ofstream::app);
        if( !log_stream ){
            std::cerr << "Could not open log file: " << *config.log_file << "\n";
            return EXIT_FAILURE;
        }
        set_log_stream(log_stream);
    }
    set_log_level(config.log_level);

    try{
        std::optional<Pid_File> pid_file;
        auto pidfile = config.pidfile;
        if( !pidfile.has_value() && !config.foreground ){
            pidfile = default_pidfile();
        }
        if( pidfile.has_value() ){
            pid_file.emplace(*pidfile);
        }

        Queue queue(config.max_finished);
        Executor executor(queue, executor_settings(config));
        Server server(queue, executor, server_settings(config));
        server.open();

        if( !config.foreground ){
            if( daemon(0, 0) < 0 ){
                throw system_error(Error_Kind::IO_ERROR, "daemon() failed", errno);
            }
            if( pid_file ){
                pid_file->update();
            }
        }
        log(fmt::format("qmanager daemon started, pid {}.", getpid()));

        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGTERM);
        sigaddset(&signals, SIGINT);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);
        serve(server, executor, signals);
        log("qmanager daemon stopped.");
    }
    catch( Error const& e ){
        log(e.what(), Message_Type::ERROR);
        if( config.log_file.has_value() ){
            std::cerr << "qmanager_server: " << e.what() << "\n";
        }
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
