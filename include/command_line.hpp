#ifndef QMANAGER_COMMAND_LINE_HPP
#define QMANAGER_COMMAND_LINE_HPP

#include <map>
#include <string>
#include <vector>

namespace QManager{
    // Maps the first word of a cmdline to the executable that runs it.
    using Appkeys = std::map<std::string, std::string>;

    /*
     * Splits a cmdline into an argument vector without involving a shell:
     *  - unquoted whitespace separates words
     *  - '...' is taken literally
     *  - "..." is literal except for \" and \\
     *  - a backslash outside quotes escapes the next character
     * Nothing is expanded. Throws INVALID_REQUEST on an unterminated quote or a
     * trailing backslash.
     */
    std::vector<std::string> split_command_line(std::string const& cmdline);

    // Inverse of split_command_line: split_command_line(join_command_line(v)) == v.
    std::string join_command_line(std::vector<std::string> const& argv);

    // Splits cmdline and, when appkeys is not empty, replaces argv[0] by the
    // executable registered for it. Throws INVALID_REQUEST for empty command lines
    // and unknown appkeys.
    std::vector<std::string> resolve_command(std::string const& cmdline, Appkeys const& appkeys);
}

#endif //QMANAGER_COMMAND_LINE_HPP
