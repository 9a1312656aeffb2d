#ifndef QMANAGER_FILE_LOCK_HPP
#define QMANAGER_FILE_LOCK_HPP

#include "socket.hpp"

#include <string>

namespace QManager{
    /*
     * PID file held for the lifetime of the daemon. The exclusive flock lets a
     * second daemon detect the first; a stale file without a lock is taken over.
     */
    class Pid_File{
    private:
        std::string _file;
        File_Descriptor _fd;
    public:
        // Throws ALREADY_RUNNING if another process holds the lock, IO_ERROR
        // if the file cannot be written.
        explicit Pid_File(std::string file);
        ~Pid_File();
        Pid_File(Pid_File const&) = delete;
        Pid_File& operator=(Pid_File const&) = delete;

        // Rewrites the pid, needed after daemon() forked.
        void update();
        std::string const& file() const;
    };
}

#endif //QMANAGER_FILE_LOCK_HPP
