#include "client_tool.hpp"
#include "command_line.hpp"
#include "error.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

int main(int argc, char** argv){
    using namespace QManager;
    std::vector<Tool_Option> const tool_options{
        {"duration", true, "expected duration in seconds, informational"},
        {"notify", true, "command run on the server when the job finished"}
    };
    return run_client_tool(argc, argv, "qmanager_submit", "[--duration S] [--notify CMD] [--] <cmd> [args...]",
                           tool_options, [](Client& client, Options const& options, Config const&){
        if( options.arguments.empty() ){
            throw Error(Error_Kind::INVALID_REQUEST, "Nothing to submit.");
        }
        std::optional<Seconds> duration;
        if( auto it = options.tool.find("duration"); it != options.tool.end() ){
            duration = parse_seconds(it->second);
        }
        std::optional<std::string> notify;
        if( auto it = options.tool.find("notify"); it != options.tool.end() ){
            notify = it->second;
        }
        auto id = client.submit(join_command_line(options.arguments), duration, notify);
        std::cout << id << "\n";
        return EXIT_SUCCESS;
    });
}
