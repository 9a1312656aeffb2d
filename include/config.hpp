#ifndef QMANAGER_CONFIG_HPP
#define QMANAGER_CONFIG_HPP

#include "client.hpp"
#include "command_line.hpp"
#include "executor.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "server.hpp"
#include "tls.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace QManager{
    extern std::string const DEFAULT_CONFIG_FILE;
    extern std::string const DEFAULT_HOST;
    extern std::size_t const DEFAULT_OUTPUT_LIMIT;

    struct Config{
        std::vector<std::string> ca;
        bool insecure = false;
        bool system_ca = true;
        std::string host = DEFAULT_HOST;
        std::uint16_t port = DEFAULT_PORT;
        bool dump_json = false;
        Message_Type log_level = Message_Type::STATUS;
        std::optional<std::string> log_file;
        std::optional<std::string> cert;
        std::string cert_password;
        std::optional<std::string> pidfile;
        bool foreground = false;
        bool allow_notify = false;
        std::optional<std::string> notify_command;
        std::size_t max_finished = 0;
        std::size_t output_limit = DEFAULT_OUTPUT_LIMIT;
        std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
        std::string working_directory = "/";
        Appkeys appkeys;
    };

    // Every key of the configuration file, also accepted as --key on the
    // command line.
    std::vector<std::string> const& config_keys();
    // Keys whose command line option takes no argument.
    bool is_flag(std::string const& key);

    // Applies key = value. Throws CONFIG_CONFLICT for unknown keys and values
    // that do not parse.
    void set_option(Config& config, std::string const& key, std::string const& value);

    /*
        # comment
        key = value
        [appkeys]
        name = /path/to/executable

        A missing file is only an error if required.
     */
    void read_config_file(Config& config, std::string const& file, bool required);

    // Throw CONFIG_CONFLICT for option combinations that cannot work.
    void validate_daemon_config(Config const& config);
    void validate_client_config(Config const& config);

    // /run/user/<uid>/qmanager.pid
    std::string default_pidfile();

    Tls_Settings tls_settings(Config const& config);
    Server_Settings server_settings(Config const& config);
    Executor_Settings executor_settings(Config const& config);
    Client_Settings client_settings(Config const& config);
}

#endif //QMANAGER_CONFIG_HPP
