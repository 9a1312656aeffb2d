#include "command_line.hpp"
#include "error.hpp"

#include <fmt/core.h>

#include <cctype>

namespace QManager{
    namespace{
        bool is_space(char c){
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        bool needs_quoting(std::string const& word){
            if( word.empty() ){
                return true;
            }
            for( char c : word ){
                if( is_space(c) || c == '\'' || c == '"' || c == '\\' ){
                    return true;
                }
            }
            return false;
        }
    }

    std::vector<std::string> split_command_line(std::string const& cmdline){
        std::vector<std::string> argv;
        std::string word;
        bool in_word = false;
        for( std::size_t i = 0; i < cmdline.size(); ++i ){
            char c = cmdline[i];
            if( is_space(c) ){
                if( in_word ){
                    argv.push_back(word);
                    word.clear();
                    in_word = false;
                }
                continue;
            }
            in_word = true;
            if( c == '\\' ){
                if( ++i == cmdline.size() ){
                    throw Error(Error_Kind::INVALID_REQUEST, "Command line ends with a backslash.");
                }
                word += cmdline[i];
            }
            else if( c == '\'' ){
                auto end = cmdline.find('\'', i + 1);
                if( end == std::string::npos ){
                    throw Error(Error_Kind::INVALID_REQUEST, "Unterminated single quote in command line.");
                }
                word.append(cmdline, i + 1, end - i - 1);
                i = end;
            }
            else if( c == '"' ){
                bool closed = false;
                for( ++i; i < cmdline.size(); ++i ){
                    if( cmdline[i] == '"' ){
                        closed = true;
                        break;
                    }
                    if( cmdline[i] == '\\' && i + 1 < cmdline.size()
                        && (cmdline[i + 1] == '"' || cmdline[i + 1] == '\\') ){
                        ++i;
                    }
                    word += cmdline[i];
                }
                if( !closed ){
                    throw Error(Error_Kind::INVALID_REQUEST, "Unterminated double quote in command line.");
                }
            }
            else{
                word += c;
            }
        }
        if( in_word ){
            argv.push_back(word);
        }
        return argv;
    }

    std::string join_command_line(std::vector<std::string> const& argv){
        std::string cmdline;
        for( std::size_t i = 0; i < argv.size(); ++i ){
            if( i > 0 ){
                cmdline += ' ';
            }
            auto const& word = argv[i];
            if( !needs_quoting(word) ){
                cmdline += word;
                continue;
            }
            // 'it'\''s' style: close the quote, escape the quote, reopen.
            cmdline += '\'';
            for( char c : word ){
                if( c == '\'' ){
                    cmdline += "'\\''";
                }else{
                    cmdline += c;
                }
            }
            cmdline += '\'';
        }
        return cmdline;
    }

    std::vector<std::string> resolve_command(std::string const& cmdline, Appkeys const& appkeys){
        auto argv = split_command_line(cmdline);
        if( argv.empty() ){
            throw Error(Error_Kind::INVALID_REQUEST, "Command line is empty.");
        }
        if( appkeys.empty() ){
            return argv;
        }
        auto it = appkeys.find(argv[0]);
        if( it == appkeys.end() ){
            throw Error(Error_Kind::INVALID_REQUEST, fmt::format("Unknown appkey `{}`.", argv[0]));
        }
        argv[0] = it->second;
        return argv;
    }
}
