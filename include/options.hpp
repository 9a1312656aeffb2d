#ifndef QMANAGER_OPTIONS_HPP
#define QMANAGER_OPTIONS_HPP

#include "config.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace QManager{
    // Option understood by a single tool only, e.g. --duration of qmanager_submit.
    struct Tool_Option{
        std::string name;
        bool has_argument;
        std::string help;
    };

    struct Options{
        std::optional<std::string> config_file;
        // Configuration keys given on the command line, in order.
        std::vector<std::pair<std::string, std::string>> settings;
        std::map<std::string, std::string> tool;
        std::vector<std::string> arguments;
        bool help = false;
    };

    /*
     * Common options: -c/--config FILE, -h/--help, -H (--host), -p (--port),
     * -f (--foreground) and --<key> for every configuration key. Parsing stops
     * at the first argument that is not an option. Throws CONFIG_CONFLICT.
     */
    Options parse_options(int argc, char** argv, std::vector<Tool_Option> const& tool_options = {});

    // Defaults, then the configuration file, then the command line. A ca or
    // insecure given on the command line replaces the file's TLS trust settings.
    Config load_config(Options const& options);

    std::string usage(std::string const& program, std::string const& synopsis,
                      std::vector<Tool_Option> const& tool_options = {});
}

#endif //QMANAGER_OPTIONS_HPP
