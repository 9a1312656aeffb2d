#include "client_tool.hpp"
#include "error.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv){
    using namespace QManager;
    return run_client_tool(argc, argv, "qmanager_remove", "<job id>...", {}, [](Client& client, Options const& options, Config const&){
        if( options.arguments.empty() ){
            throw Error(Error_Kind::INVALID_REQUEST, "No job id given.");
        }
        for( auto const& argument : options.arguments ){
            auto job = client.remove(parse_job_id(argument));
            std::cout << "Job " << job.id << " (" << to_string(job.state) << ") removed.\n";
        }
        return EXIT_SUCCESS;
    });
}
