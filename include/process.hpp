#ifndef QMANAGER_PROCESS_HPP
#define QMANAGER_PROCESS_HPP

#include <sys/types.h>

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace QManager{
    enum class Exit_Reason{
        EXIT,
        SIGNAL
    };

    struct Exit_Status{
        Exit_Reason reason;
        int code;
    };

    std::string describe(Exit_Status const& status);

    /*
     * Child process started with execvp, no shell involved. Streams whose pipe
     * is not requested are connected to /dev/null. The child leads its own
     * process group.
     */
    class Process{
    private:
        pid_t _pid = -1;
        bool _reaped = false;
        int _pipes[3] = {-1, -1, -1};
        std::string _outputs[2];

        void _close_pipe(int index);
        // False once the pipe is closed.
        bool _read_output(int index, std::size_t limit);
        bool _has_exited() const;
    public:
        Process() = default;
        ~Process();
        Process(Process const&) = delete;
        Process& operator=(Process const&) = delete;

        // Starts argv[0] with the given arguments. Throws PROCESS_ERROR when the
        // fork fails or the program cannot be executed.
        void open(std::vector<std::string> const& argv, std::array<bool, 3> open_pipe = {},
                  std::string const& working_dir = "");
        pid_t pid() const;

        // Writes everything to the child's stdin and closes it.
        void write_stdin(std::string const& data);

        // Drains stdout/stderr until the process exits or both reach end of
        // file, keeping at most limit bytes of each. Output written after the
        // exit by processes it left behind is not collected.
        void collect_outputs(std::size_t limit);
        std::string const& out() const;
        std::string const& err() const;

        // Waits for termination without reaping, the pid stays valid.
        void wait_for_exit();
        Exit_Status close();
    };
}

#endif //QMANAGER_PROCESS_HPP
