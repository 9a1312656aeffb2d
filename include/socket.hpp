#ifndef QMANAGER_SOCKET_HPP
#define QMANAGER_SOCKET_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace QManager{
    // Owning file descriptor, closed on destruction.
    class File_Descriptor{
    private:
        int _fd;
    public:
        File_Descriptor(int fd = -1);
        ~File_Descriptor();
        File_Descriptor(File_Descriptor&& o) noexcept;
        File_Descriptor& operator=(File_Descriptor&& o) noexcept;
        File_Descriptor(File_Descriptor const&) = delete;
        File_Descriptor& operator=(File_Descriptor const&) = delete;

        int get() const;
        int release();
        void reset(int fd = -1);
        explicit operator bool() const;
    };

    // Listens on all addresses, dual stack where available. Port 0 picks a free
    // port, reported through selected. Throws IO_ERROR.
    File_Descriptor open_tcp_server_socket(std::uint16_t port, std::uint16_t* selected = nullptr);
    File_Descriptor open_tcp_client_socket(std::string const& host, std::uint16_t port);

    // nullopt if accept() failed for a reason local to that connection.
    std::optional<File_Descriptor> accept_connection(int listen_fd, std::string& peer);
}

#endif //QMANAGER_SOCKET_HPP
