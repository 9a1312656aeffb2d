#include "client_tool.hpp"
#include "error.hpp"
#include "log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace QManager{
    int run_client_tool(int argc, char** argv, std::string const& program, std::string const& synopsis,
                        std::vector<Tool_Option> const& tool_options, Client_Action const& action)
    {
        try{
            auto options = parse_options(argc, argv, tool_options);
            if( options.help ){
                std::cout << usage(program, synopsis, tool_options);
                return EXIT_SUCCESS;
            }
            auto config = load_config(options);
            validate_client_config(config);
            set_log_level(config.log_level);
            Client client(client_settings(config));
            return action(client, options, config);
        }
        catch( Error const& e ){
            std::cerr << fmt::format("{}: {} ({})\n", program, e.what(), to_string(e.kind()));
            return EXIT_FAILURE;
        }
    }

    namespace{
        unsigned long long parse_unsigned(std::string const& what, std::string const& argument)
        {
            if( argument.empty() || !std::all_of(argument.begin(), argument.end(), [](unsigned char c){ return std::isdigit(c); }) ){
                throw Error(Error_Kind::INVALID_REQUEST, fmt::format("Not a {}: `{}`", what, argument));
            }
            try{
                return std::stoull(argument);
            }
            catch( std::out_of_range const& ){
                throw Error(Error_Kind::INVALID_REQUEST, fmt::format("{} out of range: {}", what, argument));
            }
        }
    }

    Job_Id parse_job_id(std::string const& argument)
    {
        return parse_unsigned("job id", argument);
    }

    Seconds parse_seconds(std::string const& argument)
    {
        auto n = parse_unsigned("duration", argument);
        if( n > static_cast<unsigned long long>(std::numeric_limits<Seconds::rep>::max()) ){
            throw Error(Error_Kind::INVALID_REQUEST, fmt::format("duration out of range: {}", argument));
        }
        return Seconds(static_cast<Seconds::rep>(n));
    }
}
