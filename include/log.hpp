#ifndef QMANAGER_LOG_HPP
#define QMANAGER_LOG_HPP

#include <ostream>
#include <string>

namespace QManager{
    enum class Message_Type{
        DEBUG,
        STATUS,
        WARNING,
        ERROR
    };

    Message_Type parse_message_type(std::string const& name);

    // Process-wide sink used by the one-argument log(). Defaults to std::cerr.
    void set_log_stream(std::ostream& out);
    void set_log_level(Message_Type min_type);

    bool log(std::string const& msg, Message_Type type = Message_Type::STATUS);
    bool log(std::ostream& out, std::string const& msg, Message_Type type = Message_Type::STATUS);
}

#endif //QMANAGER_LOG_HPP
