#include "error.hpp"

#include <fmt/core.h>

#include <array>
#include <cstring>
#include <utility>

namespace QManager{
    namespace{
        std::array<std::pair<Error_Kind, char const*>, 9> const KIND_NAMES{{
            {Error_Kind::INVALID_REQUEST, "invalid_request"},
            {Error_Kind::NOT_FOUND, "not_found"},
            {Error_Kind::INVALID_TRANSITION, "invalid_transition"},
            {Error_Kind::PROTOCOL_ERROR, "protocol_error"},
            {Error_Kind::TLS_ERROR, "tls_error"},
            {Error_Kind::PROCESS_ERROR, "process_error"},
            {Error_Kind::CONFIG_CONFLICT, "config_conflict"},
            {Error_Kind::IO_ERROR, "io_error"},
            {Error_Kind::ALREADY_RUNNING, "already_running"}
        }};
    }

    std::string to_string(Error_Kind kind){
        for( auto const& [k, name] : KIND_NAMES ){
            if( k == kind ){
                return name;
            }
        }
        return "unknown";
    }

    std::optional<Error_Kind> error_kind_from_string(std::string const& name){
        for( auto const& [k, n] : KIND_NAMES ){
            if( name == n ){
                return k;
            }
        }
        return std::nullopt;
    }

    Error::Error(Error_Kind kind, std::string const& message)
    : std::runtime_error(message)
    , _kind(kind)
    {}

    Error_Kind Error::kind() const noexcept{
        return _kind;
    }

    Error system_error(Error_Kind kind, std::string const& what, int error_number){
        return Error(kind, fmt::format("{}: {}", what, std::strerror(error_number)));
    }
}
