#include "config.hpp"
#include "error.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <unistd.h>

namespace QManager{
    std::string const DEFAULT_CONFIG_FILE = "/etc/qmanager.conf";
    std::string const DEFAULT_HOST = "localhost";
    std::size_t const DEFAULT_OUTPUT_LIMIT = 64 * 1024;

    namespace{
        std::string trim(std::string const& s){
            auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
            auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c){ return std::isspace(c); }).base();
            return first < last ? std::string(first, last) : std::string();
        }

        std::string unquote(std::string const& s){
            if( s.size() >= 2 && s.front() == '"' && s.back() == '"' ){
                return s.substr(1, s.size() - 2);
            }
            return s;
        }

        bool parse_bool(std::string const& key, std::string const& value){
            if( value == "true" || value == "yes" || value == "1" ){
                return true;
            }
            if( value == "false" || value == "no" || value == "0" ){
                return false;
            }
            throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("{} expects true or false, got `{}`.", key, value));
        }

        unsigned long long parse_number(std::string const& key, std::string const& value, unsigned long long max){
            if( value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c); }) ){
                throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("{} expects a number, got `{}`.", key, value));
            }
            unsigned long long n;
            try{
                n = std::stoull(value);
            }
            catch( std::out_of_range const& ){
                n = max + 1;
            }
            if( n > max ){
                throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("{} is out of range: {}.", key, value));
            }
            return n;
        }

        std::string non_empty(std::string const& key, std::string const& value){
            if( value.empty() ){
                throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("{} must not be empty.", key));
            }
            return value;
        }
    }

    std::vector<std::string> const& config_keys(){
        static std::vector<std::string> const keys{
            "ca", "insecure", "system-ca", "host", "port", "dump-json", "log-level", "log-file",
            "cert", "cert-password", "pidfile", "foreground", "allow-notify", "notify-command",
            "max-finished", "output-limit", "max-frame-size", "working-directory"
        };
        return keys;
    }

    bool is_flag(std::string const& key){
        return key == "insecure" || key == "dump-json" || key == "foreground" || key == "allow-notify";
    }

    void set_option(Config& config, std::string const& key, std::string const& value){
        if( key == "ca" ){
            config.ca.push_back(non_empty(key, value));
        }else if( key == "insecure" ){
            config.insecure = parse_bool(key, value);
        }else if( key == "system-ca" ){
            config.system_ca = parse_bool(key, value);
        }else if( key == "host" ){
            config.host = non_empty(key, value);
        }else if( key == "port" ){
            config.port = static_cast<std::uint16_t>(parse_number(key, value, std::numeric_limits<std::uint16_t>::max()));
        }else if( key == "dump-json" ){
            config.dump_json = parse_bool(key, value);
        }else if( key == "log-level" ){
            config.log_level = parse_message_type(value);
        }else if( key == "log-file" ){
            config.log_file = non_empty(key, value);
        }else if( key == "cert" ){
            config.cert = non_empty(key, value);
        }else if( key == "cert-password" ){
            config.cert_password = value;
        }else if( key == "pidfile" ){
            config.pidfile = non_empty(key, value);
        }else if( key == "foreground" ){
            config.foreground = parse_bool(key, value);
        }else if( key == "allow-notify" ){
            config.allow_notify = parse_bool(key, value);
        }else if( key == "notify-command" ){
            config.notify_command = non_empty(key, value);
        }else if( key == "max-finished" ){
            config.max_finished = parse_number(key, value, std::numeric_limits<std::size_t>::max());
        }else if( key == "output-limit" ){
            config.output_limit = parse_number(key, value, std::numeric_limits<std::size_t>::max());
        }else if( key == "max-frame-size" ){
            config.max_frame_size = parse_number(key, value, std::numeric_limits<std::uint32_t>::max());
        }else if( key == "working-directory" ){
            config.working_directory = non_empty(key, value);
        }else{
            throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("Unknown option `{}`.", key));
        }
    }

    void read_config_file(Config& config, std::string const& file, bool required){
        std::ifstream in(file);
        if( !in ){
            if( required ){
                throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("Cannot read configuration file {}.", file));
            }
            return;
        }
        std::string line;
        std::size_t n_line{0};
        bool in_appkeys{false};
        while( std::getline(in, line) ){
            ++n_line;
            line = trim(line);
            if( line.empty() || line.front() == '#' ){
                continue;
            }
            if( line.front() == '[' ){
                if( line != "[appkeys]" ){
                    throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("{}:{}: unknown section {}", file, n_line, line));
                }
                in_appkeys = true;
                continue;
            }
            auto eq = line.find('=');
            if( eq == std::string::npos ){
                throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("{}:{}: expected key = value", file, n_line));
            }
            auto key = trim(line.substr(0, eq));
            auto value = unquote(trim(line.substr(eq + 1)));
            if( in_appkeys ){
                if( key.empty() || value.empty() ){
                    throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("{}:{}: empty appkey", file, n_line));
                }
                config.appkeys[key] = value;
                continue;
            }
            try{
                set_option(config, key, value);
            }
            catch( Error const& e ){
                throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("{}:{}: {}", file, n_line, e.what()));
            }
        }
    }

    void validate_client_config(Config const& config){
        if( config.insecure && !config.ca.empty() ){
            throw Error(Error_Kind::CONFIG_CONFLICT, "You cannot specify both insecure and ca.");
        }
        if( config.insecure && config.cert.has_value() ){
            throw Error(Error_Kind::CONFIG_CONFLICT, "You cannot specify both insecure and cert.");
        }
        if( !config.insecure && config.ca.empty() && !config.system_ca ){
            throw Error(Error_Kind::CONFIG_CONFLICT, "No CA to verify the server with, give ca or enable system-ca.");
        }
    }

    void validate_daemon_config(Config const& config){
        validate_client_config(config);
        if( !config.insecure && !config.cert.has_value() ){
            throw Error(Error_Kind::CONFIG_CONFLICT, "The daemon needs either cert or insecure.");
        }
        if( config.max_frame_size == 0 ){
            throw Error(Error_Kind::CONFIG_CONFLICT, "max-frame-size must be positive.");
        }
    }

    std::string default_pidfile(){
        return fmt::format("/run/user/{}/qmanager.pid", getuid());
    }

    Tls_Settings tls_settings(Config const& config){
        Tls_Settings settings;
        settings.certificate = config.cert;
        settings.certificate_password = config.cert_password;
        settings.ca_files = config.ca;
        settings.system_ca = config.system_ca;
        return settings;
    }

    Server_Settings server_settings(Config const& config){
        Server_Settings settings;
        settings.port = config.port;
        settings.insecure = config.insecure;
        settings.tls = tls_settings(config);
        settings.max_frame_size = config.max_frame_size;
        settings.dump_json = config.dump_json;
        return settings;
    }

    Executor_Settings executor_settings(Config const& config){
        Executor_Settings settings;
        settings.appkeys = config.appkeys;
        settings.allow_notify = config.allow_notify;
        settings.notify_command = config.notify_command;
        settings.output_limit = config.output_limit;
        settings.working_directory = config.working_directory;
        return settings;
    }

    Client_Settings client_settings(Config const& config){
        Client_Settings settings;
        settings.host = config.host;
        settings.port = config.port;
        settings.insecure = config.insecure;
        settings.tls = tls_settings(config);
        settings.dump_json = config.dump_json;
        return settings;
    }
}
