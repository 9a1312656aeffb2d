#ifndef QMANAGER_CLIENT_HPP
#define QMANAGER_CLIENT_HPP

#include "job.hpp"
#include "protocol.hpp"
#include "stream.hpp"
#include "tls.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace QManager
{
    struct Client_Settings
    {
        std::string host = "localhost";
        std::uint16_t port = DEFAULT_PORT;
        bool insecure = false;
        Tls_Settings tls;
        bool dump_json = false;
    };

    /*
     * One connection to the daemon. Error responses are rethrown as Error with
     * the kind the daemon reported.
     */
    class Client
    {
    private:
        Client_Settings _settings;
        std::unique_ptr<Stream> _stream;

        Response _call(Request const& request);
    public:
        // Connects and runs the TLS handshake unless insecure.
        explicit Client(Client_Settings settings);

        Job_Id submit(std::string const& cmdline, std::optional<Seconds> expected_duration = std::nullopt,
                      std::optional<std::string> const& notify_cmd = std::nullopt);
        Queue_Status_Response queue_status();
        Job remove(Job_Id id);
        void kill(Job_Id id);
        Queue_State pause();
        Queue_State resume();

        // Sends a request and returns the undecoded response document.
        std::string raw_call(Request const& request);
    };

    // Tab separated table of a queue snapshot.
    void write_status(std::ostream& out, std::vector<Job> const& jobs);
}

#endif //QMANAGER_CLIENT_HPP
