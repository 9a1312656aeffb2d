#include "config.hpp"
#include "error.hpp"
#include "options.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace QManager{
    namespace{
        class Config_File{
        private:
            std::string _path;
        public:
            explicit Config_File(std::string const& content){
                std::string pattern = ::testing::TempDir() + "qmanager_conf_XXXXXX";
                int fd = mkstemp(pattern.data());
                if( fd < 0 ){
                    throw system_error(Error_Kind::IO_ERROR, "mkstemp() failed", errno);
                }
                ::close(fd);
                _path = pattern;
                std::ofstream(_path) << content;
            }
            ~Config_File(){
                std::remove(_path.c_str());
            }
            std::string const& path() const{
                return _path;
            }
        };

        Options parse(std::vector<std::string> args, std::vector<Tool_Option> const& tool_options = {}){
            std::vector<char*> argv;
            for( auto& arg : args ){
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);
            return parse_options(static_cast<int>(args.size()), argv.data(), tool_options);
        }

        template<typename F>
        Error_Kind error_kind_of(F&& f){
            try{
                f();
            }
            catch( Error const& e ){
                return e.kind();
            }
            ADD_FAILURE() << "no Error thrown";
            return Error_Kind::IO_ERROR;
        }
    }

    TEST(Config, Defaults){
        Config config;
        EXPECT_EQ(config.port, 1337);
        EXPECT_EQ(config.host, "localhost");
        EXPECT_FALSE(config.insecure);
        EXPECT_FALSE(config.allow_notify);
        EXPECT_EQ(config.max_finished, 0u);
        EXPECT_EQ(config.max_frame_size, 16u * 1024 * 1024);
        EXPECT_EQ(DEFAULT_CONFIG_FILE, "/etc/qmanager.conf");
    }

    TEST(Config, InsecureWithCaIsAConflict){
        Config config;
        config.insecure = true;
        config.ca.push_back("ca.pem");
        EXPECT_EQ(error_kind_of([&](){ validate_daemon_config(config); }), Error_Kind::CONFIG_CONFLICT);
        EXPECT_EQ(error_kind_of([&](){ validate_client_config(config); }), Error_Kind::CONFIG_CONFLICT);

        Config_File empty("");
        auto options = parse({"qmanager_server", "-c", empty.path(), "--insecure", "--ca", "ca.pem"});
        auto loaded = load_config(options);
        EXPECT_EQ(error_kind_of([&](){ validate_daemon_config(loaded); }), Error_Kind::CONFIG_CONFLICT);
    }

    TEST(Config, DaemonNeedsCertificateOrInsecure){
        Config config;
        EXPECT_EQ(error_kind_of([&](){ validate_daemon_config(config); }), Error_Kind::CONFIG_CONFLICT);
        EXPECT_NO_THROW(validate_client_config(config));
        config.cert = "server.p12";
        EXPECT_NO_THROW(validate_daemon_config(config));
        config.insecure = true;
        EXPECT_EQ(error_kind_of([&](){ validate_daemon_config(config); }), Error_Kind::CONFIG_CONFLICT);
        config.cert.reset();
        EXPECT_NO_THROW(validate_daemon_config(config));
    }

    TEST(Config, ReadsFile){
        Config_File file(
            "# qmanager\n"
            "port = 4242\n"
            "host = hybrid.example.org\n"
            "ca = /etc/ssl/a.pem\n"
            "ca = \"/etc/ssl/b.pem\"\n"
            "system-ca = false\n"
            "allow-notify = yes\n"
            "max-finished = 100\n"
            "log-level = debug\n"
            "\n"
            "[appkeys]\n"
            "sim = /opt/hybrid/bin/simulate\n"
        );
        Config config;
        read_config_file(config, file.path(), true);
        EXPECT_EQ(config.port, 4242);
        EXPECT_EQ(config.host, "hybrid.example.org");
        EXPECT_EQ(config.ca, (std::vector<std::string>{"/etc/ssl/a.pem", "/etc/ssl/b.pem"}));
        EXPECT_FALSE(config.system_ca);
        EXPECT_TRUE(config.allow_notify);
        EXPECT_EQ(config.max_finished, 100u);
        EXPECT_EQ(config.log_level, Message_Type::DEBUG);
        EXPECT_EQ(config.appkeys.at("sim"), "/opt/hybrid/bin/simulate");
    }

    TEST(Config, RejectsBadFiles){
        for( std::string const& content : {"colour = blue\n", "port = 70000\n", "port = ten\n",
                                           "insecure = maybe\n", "[jobs]\n", "just words\n"} ){
            Config_File file(content);
            Config config;
            try{
                read_config_file(config, file.path(), true);
                ADD_FAILURE() << content;
            }
            catch( Error const& e ){
                EXPECT_EQ(e.kind(), Error_Kind::CONFIG_CONFLICT);
                EXPECT_NE(std::string(e.what()).find(":1:"), std::string::npos) << e.what();
            }
        }
    }

    TEST(Config, MissingFiles){
        Config config;
        EXPECT_NO_THROW(read_config_file(config, "/nonexistent/qmanager.conf", false));
        EXPECT_EQ(error_kind_of([&](){ read_config_file(config, "/nonexistent/qmanager.conf", true); }),
                  Error_Kind::CONFIG_CONFLICT);
    }

    TEST(Config, CommandLineOverridesFile){
        Config_File file("port = 2000\nca = file.pem\ncert = server.p12\n");
        auto config = load_config(parse({"qmanager_status", "-c", file.path(), "-p", "3000", "--ca", "cli.pem"}));
        EXPECT_EQ(config.port, 3000);
        EXPECT_EQ(config.ca, std::vector<std::string>{"cli.pem"});
        EXPECT_EQ(config.cert, std::optional<std::string>("server.p12"));

        auto insecure = load_config(parse({"qmanager_status", "-c", file.path(), "--insecure"}));
        EXPECT_TRUE(insecure.insecure);
        EXPECT_TRUE(insecure.ca.empty());
        EXPECT_FALSE(insecure.cert.has_value());
        EXPECT_NO_THROW(validate_client_config(insecure));
    }

    TEST(Options, StopAtTheCommand){
        std::vector<Tool_Option> tool_options{{"duration", true, ""}, {"notify", true, ""}};
        auto options = parse({"qmanager_submit", "--insecure", "--duration", "5", "echo", "-n", "hi"}, tool_options);
        EXPECT_EQ(options.tool.at("duration"), "5");
        EXPECT_EQ(options.tool.count("notify"), 0u);
        EXPECT_EQ(options.arguments, (std::vector<std::string>{"echo", "-n", "hi"}));
        ASSERT_EQ(options.settings.size(), 1u);
        EXPECT_EQ(options.settings[0].first, "insecure");

        auto dashed = parse({"qmanager_submit", "--", "--weird-program"}, tool_options);
        EXPECT_EQ(dashed.arguments, std::vector<std::string>{"--weird-program"});
    }

    TEST(Options, RejectsUnknownOptions){
        EXPECT_EQ(error_kind_of([](){ parse({"qmanager_status", "--colour"}); }), Error_Kind::CONFIG_CONFLICT);
        EXPECT_EQ(error_kind_of([](){ parse({"qmanager_status", "--port"}); }), Error_Kind::CONFIG_CONFLICT);
        EXPECT_TRUE(parse({"qmanager_status", "-h"}).help);
    }
}
