#ifndef QMANAGER_ERROR_HPP
#define QMANAGER_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace QManager{
    enum class Error_Kind{
        INVALID_REQUEST,
        NOT_FOUND,
        INVALID_TRANSITION,
        PROTOCOL_ERROR,
        TLS_ERROR,
        PROCESS_ERROR,
        CONFIG_CONFLICT,
        IO_ERROR,
        ALREADY_RUNNING
    };

    // Wire name of the kind, e.g. "invalid_request".
    std::string to_string(Error_Kind kind);
    std::optional<Error_Kind> error_kind_from_string(std::string const& name);

    class Error : public std::runtime_error
    {
    private:
        Error_Kind _kind;
    public:
        Error(Error_Kind kind, std::string const& message);
        Error_Kind kind() const noexcept;
    };

    // Error with strerror(errno) appended to the message.
    Error system_error(Error_Kind kind, std::string const& what, int error_number);
}

#endif //QMANAGER_ERROR_HPP
