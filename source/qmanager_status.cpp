#include "client_tool.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv){
    using namespace QManager;
    return run_client_tool(argc, argv, "qmanager_status", "", {}, [](Client& client, Options const&, Config const& config){
        if( config.dump_json ){
            std::cout << client.raw_call(Queue_Status_Request{}) << "\n";
        }
        else{
            auto status = client.queue_status();
            std::cout << "Queue is " << to_string(status.state) << ".\n";
            write_status(std::cout, status.jobs);
        }
        return EXIT_SUCCESS;
    });
}
