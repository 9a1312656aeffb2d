#include "error.hpp"
#include "options.hpp"

#include <fmt/core.h>

#include <algorithm>

#include <getopt.h>

namespace QManager{
    namespace{
        int const CONFIG_OPTION = 256;
        int const TOOL_OPTION = 512;

        char const* short_key(int c){
            switch( c ){
                case 'H': return "host";
                case 'p': return "port";
                case 'f': return "foreground";
                default: return nullptr;
            }
        }
    }

    Options parse_options(int argc, char** argv, std::vector<Tool_Option> const& tool_options){
        auto const& keys = config_keys();
        std::vector<option> longopts;
        longopts.push_back({"config", required_argument, nullptr, 'c'});
        longopts.push_back({"help", no_argument, nullptr, 'h'});
        for( std::size_t i = 0; i < keys.size(); ++i ){
            longopts.push_back({keys[i].c_str(), is_flag(keys[i]) ? no_argument : required_argument, nullptr,
                                CONFIG_OPTION + static_cast<int>(i)});
        }
        for( std::size_t i = 0; i < tool_options.size(); ++i ){
            longopts.push_back({tool_options[i].name.c_str(),
                                tool_options[i].has_argument ? required_argument : no_argument, nullptr,
                                TOOL_OPTION + static_cast<int>(i)});
        }
        longopts.push_back({nullptr, 0, nullptr, 0});

        Options result;
        optind = 0;
        opterr = 0;
        int c;
        while( (c = getopt_long(argc, argv, "+c:hH:p:f", longopts.data(), nullptr)) != -1 ){
            if( c == 'c' ){
                result.config_file = optarg;
            }else if( c == 'h' ){
                result.help = true;
            }else if( auto key = short_key(c) ){
                result.settings.emplace_back(key, optarg != nullptr ? optarg : "true");
            }else if( c >= TOOL_OPTION ){
                auto const& tool = tool_options[static_cast<std::size_t>(c - TOOL_OPTION)];
                result.tool[tool.name] = optarg != nullptr ? optarg : "true";
            }else if( c >= CONFIG_OPTION ){
                result.settings.emplace_back(keys[static_cast<std::size_t>(c - CONFIG_OPTION)],
                                             optarg != nullptr ? optarg : "true");
            }else{
                throw Error(Error_Kind::CONFIG_CONFLICT,
                            fmt::format("Invalid option or missing argument: {}", argv[optind - 1]));
            }
        }
        for( int i = optind; i < argc; ++i ){
            result.arguments.emplace_back(argv[i]);
        }
        return result;
    }

    Config load_config(Options const& options){
        Config config;
        read_config_file(config, options.config_file.value_or(DEFAULT_CONFIG_FILE), options.config_file.has_value());
        auto given = [&options](std::string const& key){
            return std::any_of(options.settings.begin(), options.settings.end(),
                               [&key](auto const& setting){ return setting.first == key; });
        };
        if( given("insecure") ){
            config.ca.clear();
            config.cert.reset();
        }
        else if( given("ca") ){
            config.ca.clear();
        }
        for( auto const& [key, value] : options.settings ){
            set_option(config, key, value);
        }
        return config;
    }

    std::string usage(std::string const& program, std::string const& synopsis,
                      std::vector<Tool_Option> const& tool_options){
        std::string text = fmt::format("{} usage:\n{} [options] {}\n\n", program, program, synopsis);
        for( auto const& tool : tool_options ){
            text += fmt::format("  --{:<20} {}\n", tool.name + (tool.has_argument ? " ARG" : ""), tool.help);
        }
        text += fmt::format("  -c, --config FILE      configuration file (default {})\n", DEFAULT_CONFIG_FILE);
        text += "  -H, --host HOST        daemon host\n";
        text += "  -p, --port PORT        daemon port\n";
        text += "  --insecure             plain TCP without TLS\n";
        text += "  --ca FILE              trusted CA certificates (PEM), repeatable\n";
        text += "  --cert FILE            PKCS#12 certificate bundle\n";
        text += "  --dump-json            log every JSON document\n";
        text += "  --<key> VALUE          any other configuration key\n";
        text += "  -h, --help             this text\n";
        return text;
    }
}
