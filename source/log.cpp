#include "error.hpp"
#include "log.hpp"
#include "time.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace QManager{
    namespace{
        std::mutex log_mutex;
        std::ostream* log_stream = &std::cerr;
        Message_Type log_level = Message_Type::STATUS;

        char const* marker(Message_Type type){
            switch( type ){
                case Message_Type::DEBUG:
                    return "...";
                case Message_Type::STATUS:
                    return "###";
                case Message_Type::WARNING:
                    return "@@@";
                case Message_Type::ERROR:
                    return "!!!";
            }
            return "???";
        }
    }

    Message_Type parse_message_type(std::string const& name){
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){
            return static_cast<char>(std::tolower(c));
        });
        if( lower == "debug" ){
            return Message_Type::DEBUG;
        }
        if( lower == "status" || lower == "info" ){
            return Message_Type::STATUS;
        }
        if( lower == "warning" || lower == "warn" ){
            return Message_Type::WARNING;
        }
        if( lower == "error" ){
            return Message_Type::ERROR;
        }
        throw Error(Error_Kind::CONFIG_CONFLICT, fmt::format("Unknown log level `{}`.", name));
    }

    void set_log_stream(std::ostream& out){
        std::lock_guard<std::mutex> lock(log_mutex);
        log_stream = &out;
    }

    void set_log_level(Message_Type min_type){
        std::lock_guard<std::mutex> lock(log_mutex);
        log_level = min_type;
    }

    bool log(std::string const& msg, Message_Type type)
    {
        std::ostream* out;
        {
            std::lock_guard<std::mutex> lock(log_mutex);
            if( type < log_level ){
                return true;
            }
            out = log_stream;
        }
        return log(*out, msg, type);
    }

    bool log(std::ostream& out, const std::string &msg, Message_Type type)
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        out << marker(type) << str_time() << ": " << msg << "\n";
        if( type >= Message_Type::WARNING ){
            out << std::flush;
        }
        return out.good();
    }
}
