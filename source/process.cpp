#include "error.hpp"
#include "process.hpp"
#include "socket.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <tuple>

#include <fcntl.h>
#include <poll.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace QManager{
    namespace{
        // Exit checks when no pidfd is available.
        int const EXIT_POLL_INTERVAL_MS = 100;

        // Readable once the process exits, invalid on kernels without pidfd.
        File_Descriptor open_exit_fd(pid_t pid){
#ifdef SYS_pidfd_open
            return File_Descriptor(static_cast<int>(syscall(SYS_pidfd_open, pid, 0)));
#else
            return File_Descriptor();
#endif
        }

        void close_pair(int fds[2]){
            for( int i = 0; i < 2; ++i ){
                if( fds[i] >= 0 ){
                    ::close(fds[i]);
                    fds[i] = -1;
                }
            }
        }

        // Only async-signal-safe calls between fork() and exec.
        [[noreturn]] void exec_child(char* const* argv, char const* working_dir, int const child_fds[3], int report_fd){
            // Own process group, so signals also reach whatever the job spawns.
            setpgid(0, 0);
            int null_fd = -1;
            for( int i = 0; i < 3; ++i ){
                int fd = child_fds[i];
                if( fd < 0 ){
                    if( null_fd < 0 ){
                        null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
                    }
                    fd = null_fd;
                }
                if( fd < 0 || dup2(fd, i) < 0 ){
                    int e = errno;
                    std::ignore = ::write(report_fd, &e, sizeof(e));
                    _exit(127);
                }
            }
            sigset_t all;
            sigemptyset(&all);
            sigprocmask(SIG_SETMASK, &all, nullptr);
            signal(SIGPIPE, SIG_DFL);
            if( working_dir != nullptr && chdir(working_dir) < 0 ){
                int e = errno;
                std::ignore = ::write(report_fd, &e, sizeof(e));
                _exit(127);
            }
            execvp(argv[0], argv);
            int e = errno;
            std::ignore = ::write(report_fd, &e, sizeof(e));
            _exit(127);
        }
    }

    std::string describe(Exit_Status const& status){
        if( status.reason == Exit_Reason::EXIT ){
            return fmt::format("exited with code {}", status.code);
        }
        return fmt::format("killed by signal {} ({})", status.code, strsignal(status.code));
    }

    Process::~Process(){
        for( int i = 0; i < 3; ++i ){
            _close_pipe(i);
        }
        if( _pid > 0 && !_reaped ){
            if( ::kill(-_pid, SIGKILL) < 0 ){
                ::kill(_pid, SIGKILL);
            }
            int status;
            while( waitpid(_pid, &status, 0) < 0 && errno == EINTR ){
            }
        }
    }

    void Process::_close_pipe(int index){
        if( _pipes[index] >= 0 ){
            ::close(_pipes[index]);
            _pipes[index] = -1;
        }
    }

    void Process::open(std::vector<std::string> const& argv, std::array<bool, 3> open_pipe, std::string const& working_dir)
    {
        if( argv.empty() ){
            throw Error(Error_Kind::PROCESS_ERROR, "No program to execute.");
        }
        std::vector<char*> c_argv;
        for( auto const& arg : argv ){
            c_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        c_argv.push_back(nullptr);

        int fds[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
        int report[2] = {-1, -1};
        auto cleanup = [&](){
            for( auto& pair : fds ){
                close_pair(pair);
            }
            close_pair(report);
        };
        for( int i = 0; i < 3; ++i ){
            if( open_pipe[i] && pipe2(fds[i], O_CLOEXEC) < 0 ){
                int e = errno;
                cleanup();
                throw system_error(Error_Kind::PROCESS_ERROR, "Failed to create pipe", e);
            }
        }
        if( pipe2(report, O_CLOEXEC) < 0 ){
            int e = errno;
            cleanup();
            throw system_error(Error_Kind::PROCESS_ERROR, "Failed to create pipe", e);
        }

        // Child side of each pipe: read end of stdin, write ends of stdout/stderr.
        int const child_fds[3] = {fds[0][0], fds[1][1], fds[2][1]};
        char const* dir = working_dir.empty() ? nullptr : working_dir.c_str();

        pid_t pid = fork();
        if( pid < 0 ){
            int e = errno;
            cleanup();
            throw system_error(Error_Kind::PROCESS_ERROR, "Failed to fork process", e);
        }
        if( pid == 0 ){
            exec_child(c_argv.data(), dir, child_fds, report[1]);
        }

        // Also set here, the child may not have run yet when the job is signalled.
        setpgid(pid, pid);
        _pid = pid;
        _reaped = false;
        ::close(report[1]);
        report[1] = -1;
        for( int i = 0; i < 3; ++i ){
            int parent_end = i == 0 ? 1 : 0;
            _pipes[i] = fds[i][parent_end];
            fds[i][parent_end] = -1;
            close_pair(fds[i]);
        }

        int child_errno = 0;
        ssize_t n;
        while( (n = ::read(report[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR ){
        }
        close_pair(report);
        if( n == sizeof(child_errno) ){
            for( int i = 0; i < 3; ++i ){
                _close_pipe(i);
            }
            close();
            throw system_error(Error_Kind::PROCESS_ERROR, fmt::format("Failed to execute `{}`", argv[0]), child_errno);
        }
    }

    pid_t Process::pid() const{
        return _pid;
    }

    void Process::write_stdin(std::string const& data)
    {
        if( _pipes[0] < 0 ){
            throw Error(Error_Kind::PROCESS_ERROR, "Standard input of the process is not a pipe.");
        }
        std::size_t written = 0;
        while( written < data.size() ){
            auto n = ::write(_pipes[0], data.data() + written, data.size() - written);
            if( n < 0 ){
                if( errno == EINTR ){
                    continue;
                }
                int e = errno;
                _close_pipe(0);
                throw system_error(Error_Kind::PROCESS_ERROR, "Failed to write to process", e);
            }
            written += static_cast<std::size_t>(n);
        }
        _close_pipe(0);
    }

    bool Process::_read_output(int index, std::size_t limit)
    {
        char buf[4096];
        auto n = ::read(_pipes[index], buf, sizeof(buf));
        if( n < 0 && errno == EINTR ){
            return true;
        }
        if( n <= 0 ){
            _close_pipe(index);
            return false;
        }
        auto& output = _outputs[index - 1];
        if( output.size() < limit ){
            output.append(buf, std::min<std::size_t>(static_cast<std::size_t>(n), limit - output.size()));
        }
        return true;
    }

    bool Process::_has_exited() const
    {
        siginfo_t info;
        info.si_pid = 0;
        if( waitid(P_PID, static_cast<id_t>(_pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0 ){
            return errno != EINTR;
        }
        return info.si_pid != 0;
    }

    void Process::collect_outputs(std::size_t limit)
    {
        auto exit_fd = open_exit_fd(_pid);
        bool exited = false;
        while( !exited && (_pipes[1] >= 0 || _pipes[2] >= 0) ){
            pollfd fds[3];
            nfds_t n_fds = 0;
            int index[3];
            for( int i = 1; i <= 2; ++i ){
                if( _pipes[i] >= 0 ){
                    fds[n_fds] = pollfd{_pipes[i], POLLIN, 0};
                    index[n_fds++] = i;
                }
            }
            if( exit_fd ){
                fds[n_fds] = pollfd{exit_fd.get(), POLLIN, 0};
                index[n_fds++] = 0;
            }
            if( poll(fds, n_fds, exit_fd ? -1 : EXIT_POLL_INTERVAL_MS) < 0 ){
                if( errno == EINTR ){
                    continue;
                }
                throw system_error(Error_Kind::PROCESS_ERROR, "poll() failed", errno);
            }
            for( nfds_t k = 0; k < n_fds; ++k ){
                if( !(fds[k].revents & (POLLIN | POLLHUP | POLLERR)) ){
                    continue;
                }
                if( index[k] == 0 ){
                    exited = true;
                }
                else{
                    _read_output(index[k], limit);
                }
            }
            if( !exit_fd && _has_exited() ){
                exited = true;
            }
        }
        // Descendants may still hold the pipes open. Keep what is already
        // buffered and stop there.
        for( int i = 1; i <= 2; ++i ){
            if( _pipes[i] < 0 ){
                continue;
            }
            int flags = fcntl(_pipes[i], F_GETFL);
            if( flags >= 0 && fcntl(_pipes[i], F_SETFL, flags | O_NONBLOCK) >= 0 ){
                while( _outputs[i - 1].size() < limit && _read_output(i, limit) ){
                }
            }
            _close_pipe(i);
        }
    }

    std::string const& Process::out() const{
        return _outputs[0];
    }

    std::string const& Process::err() const{
        return _outputs[1];
    }

    void Process::wait_for_exit()
    {
        siginfo_t info;
        while( waitid(P_PID, static_cast<id_t>(_pid), &info, WEXITED | WNOWAIT) < 0 ){
            if( errno != EINTR ){
                throw system_error(Error_Kind::PROCESS_ERROR, fmt::format("waitid({}) failed", _pid), errno);
            }
        }
    }

    Exit_Status Process::close()
    {
        _close_pipe(0);
        int status = 0;
        while( waitpid(_pid, &status, 0) < 0 ){
            if( errno != EINTR ){
                _reaped = true;
                throw system_error(Error_Kind::PROCESS_ERROR, fmt::format("waitpid({}) failed", _pid), errno);
            }
        }
        _reaped = true;
        for( int i = 1; i <= 2; ++i ){
            _close_pipe(i);
        }
        if( WIFEXITED(status) ){
            return {Exit_Reason::EXIT, WEXITSTATUS(status)};
        }
        return {Exit_Reason::SIGNAL, WTERMSIG(status)};
    }
}
