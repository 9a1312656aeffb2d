#ifndef QMANAGER_CLIENT_TOOL_HPP
#define QMANAGER_CLIENT_TOOL_HPP

#include "client.hpp"
#include "config.hpp"
#include "options.hpp"

#include <functional>
#include <string>
#include <vector>

namespace QManager{
    using Client_Action = std::function<int(Client& client, Options const& options, Config const& config)>;

    // Shared main() of the client tools: parses options, loads the
    // configuration, connects and runs action. Errors go to std::cerr and
    // give EXIT_FAILURE.
    int run_client_tool(int argc, char** argv, std::string const& program, std::string const& synopsis,
                        std::vector<Tool_Option> const& tool_options, Client_Action const& action);

    // Job id from a command line argument. Throws INVALID_REQUEST.
    Job_Id parse_job_id(std::string const& argument);
    Seconds parse_seconds(std::string const& argument);
}

#endif //QMANAGER_CLIENT_TOOL_HPP
