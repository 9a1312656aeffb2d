#ifndef QMANAGER_SERVER_HPP
#define QMANAGER_SERVER_HPP

#include "executor.hpp"
#include "protocol.hpp"
#include "queue.hpp"
#include "socket.hpp"
#include "tls.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace QManager
{
    struct Server_Settings
    {
        std::uint16_t port = DEFAULT_PORT;
        bool insecure = false;
        Tls_Settings tls;
        std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
        bool dump_json = false;
    };

    /*
     * Accepts connections and serves each on its own thread. Requests are
     * dispatched to the queue and the executor, which do all coordination.
     */
    class Server
    {
    private:
        struct Connection
        {
            std::thread thread;
            // Duplicate of the socket, only used to shut it down from stop().
            File_Descriptor control;
            std::atomic<bool> done{false};
        };

        Queue& _queue;
        Executor& _executor;
        Server_Settings _settings;
        std::optional<Tls_Context> _tls;
        File_Descriptor _listener;
        File_Descriptor _stop_event;
        std::uint16_t _port;
        std::mutex _connections_mutex;
        std::list<Connection> _connections;

        void _spawn(File_Descriptor fd, std::string const& peer);
        void _serve(Connection& connection, File_Descriptor fd, std::string peer);
        void _reap_connections();
        void _close_connections();

        Response _handle(Submit_Request const& request);
        Response _handle(Queue_Status_Request const& request);
        Response _handle(Remove_Request const& request);
        Response _handle(Kill_Request const& request);
        Response _handle(Pause_Request const& request);
        Response _handle(Resume_Request const& request);
    public:
        Server(Queue& queue, Executor& executor, Server_Settings settings);
        ~Server();
        Server(Server const&) = delete;
        Server& operator=(Server const&) = delete;

        // Loads the TLS context and starts listening. Errors are fatal for the
        // daemon, nothing has been served yet.
        void open();
        // Bound port, differs from the configured one when that was 0.
        std::uint16_t port() const;

        // Accept loop. Returns after stop(), once every connection is closed.
        void run();
        // Safe to call from any thread, also before run().
        void stop();

        // Queue level failures are answered with an Error_Response.
        Response handle(Request const& request);
    };
}

#endif //QMANAGER_SERVER_HPP
