#include "client_tool.hpp"
#include "error.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv){
    using namespace QManager;
    return run_client_tool(argc, argv, "qmanager_kill", "<job id>", {}, [](Client& client, Options const& options, Config const&){
        if( options.arguments.size() != 1 ){
            throw Error(Error_Kind::INVALID_REQUEST, "Expected exactly one job id.");
        }
        auto id = parse_job_id(options.arguments.front());
        client.kill(id);
        std::cout << "Job " << id << " asked to terminate.\n";
        return EXIT_SUCCESS;
    });
}
