#include "client_tool.hpp"
#include "error.hpp"

#include <cstdlib>
#include <iostream>
#include <variant>

int main(int argc, char** argv){
    using namespace QManager;
    return run_client_tool(argc, argv, "qmanager_queue", "[pause|resume]", {}, [](Client& client, Options const& options, Config const& config){
        if( options.arguments.size() > 1 ){
            throw Error(Error_Kind::INVALID_REQUEST, "Expected at most one action.");
        }
        Request request = Queue_Status_Request{};
        if( !options.arguments.empty() ){
            auto const& action = options.arguments.front();
            if( action == "pause" ){
                request = Pause_Request{};
            }
            else if( action == "resume" ){
                request = Resume_Request{};
            }
            else{
                throw Error(Error_Kind::INVALID_REQUEST, "Unknown action `" + action + "`, expected pause or resume.");
            }
        }
        if( config.dump_json ){
            std::cout << client.raw_call(request) << "\n";
            return EXIT_SUCCESS;
        }
        Queue_State state;
        if( std::holds_alternative<Pause_Request>(request) ){
            state = client.pause();
        }
        else if( std::holds_alternative<Resume_Request>(request) ){
            state = client.resume();
        }
        else{
            state = client.queue_status().state;
        }
        std::cout << "Queue is " << to_string(state) << ".\n";
        return EXIT_SUCCESS;
    });
}
