#ifndef QMANAGER_STREAM_HPP
#define QMANAGER_STREAM_HPP

#include "socket.hpp"

#include <cstddef>
#include <string>

namespace QManager{
    // Broken connections and pipes are reported as EPIPE instead of killing
    // the process.
    void ignore_sigpipe();

    // Byte stream of one connection, plain TCP or TLS.
    class Stream{
    public:
        virtual ~Stream() = default;

        // Returns 0 at end of stream. Throws IO_ERROR / TLS_ERROR.
        virtual std::size_t read_some(char* buffer, std::size_t size) = 0;
        virtual void write_all(char const* data, std::size_t size) = 0;

        // Unblocks pending reads and writes from another thread.
        virtual void shutdown() = 0;
        virtual std::string const& peer() const = 0;

        // Number of bytes read, less than size only at end of stream.
        std::size_t read_exact(char* buffer, std::size_t size);
    };

    class Plain_Stream : public Stream{
    private:
        File_Descriptor _fd;
        std::string _peer;
    public:
        Plain_Stream(File_Descriptor fd, std::string peer);

        std::size_t read_some(char* buffer, std::size_t size) override;
        void write_all(char const* data, std::size_t size) override;
        void shutdown() override;
        std::string const& peer() const override;
    };
}

#endif //QMANAGER_STREAM_HPP
