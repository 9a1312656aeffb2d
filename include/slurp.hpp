#ifndef QMANAGER_SLURP_HPP
#define QMANAGER_SLURP_HPP

#include <string>

namespace QManager{
    // Whole file as bytes. Throws IO_ERROR if it cannot be read.
    std::string slurp(std::string const& file);
}

#endif //QMANAGER_SLURP_HPP
