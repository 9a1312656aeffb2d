#include "error.hpp"
#include "slurp.hpp"

#include <fmt/core.h>

#include <fstream>
#include <sstream>

namespace QManager{
    std::string slurp(const std::string &file)
    {
        std::ifstream in(file, std::ios::binary);
        if( !in ){
            throw Error(Error_Kind::IO_ERROR, fmt::format("Could not open file {}.", file));
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        if( in.bad() ){
            throw Error(Error_Kind::IO_ERROR, fmt::format("Could not read file {}.", file));
        }
        return buffer.str();
    }
}
