#include "error.hpp"
#include "file_lock.hpp"
#include "slurp.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace QManager{
    namespace{
        std::string pid_file_path(char const* name){
            return ::testing::TempDir() + name + std::to_string(getpid());
        }
    }

    TEST(Pid_File, WritesPidAndRemovesFileOnRelease){
        auto path = pid_file_path("qmanager_pid_");
        {
            Pid_File pid_file(path);
            EXPECT_EQ(pid_file.file(), path);
            EXPECT_EQ(slurp(path), std::to_string(getpid()) + "\n");
        }
        EXPECT_FALSE(std::filesystem::exists(path));
    }

    TEST(Pid_File, SecondHolderIsRejected){
        auto path = pid_file_path("qmanager_pid_twice_");
        Pid_File first(path);
        try{
            Pid_File second(path);
            ADD_FAILURE() << "pid file locked twice";
        }
        catch( Error const& e ){
            EXPECT_EQ(e.kind(), Error_Kind::ALREADY_RUNNING);
        }
        EXPECT_TRUE(std::filesystem::exists(path));
    }

    TEST(Pid_File, StaleFileIsTakenOver){
        auto path = pid_file_path("qmanager_pid_stale_");
        std::ofstream(path) << "999999999\n";
        {
            Pid_File pid_file(path);
            EXPECT_EQ(slurp(path), std::to_string(getpid()) + "\n");
        }
        EXPECT_FALSE(std::filesystem::exists(path));
    }

    TEST(Pid_File, UnwritableLocation){
        try{
            Pid_File pid_file("/nonexistent/directory/qmanager.pid");
            ADD_FAILURE() << "pid file created";
        }
        catch( Error const& e ){
            EXPECT_EQ(e.kind(), Error_Kind::IO_ERROR);
        }
    }
}
