#include "time.hpp"

#include <fmt/core.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace QManager{
    Time_Point now()
    {
        return std::chrono::time_point_cast<Micros>(Clock::now());
    }

    long long int to_micros(Time_Point const& tp)
    {
        return tp.time_since_epoch().count();
    }

    Time_Point from_micros(long long int micros)
    {
        return Time_Point(Micros(micros));
    }

    std::string str_time()
    {
        return str_time(now());
    }

    std::string str_time(Time_Point const& tp)
    {
        auto converted = Clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&converted, &local);
        std::stringstream ss;
        ss << std::put_time(&local, "[%Y-%m-%d %X]");
        return ss.str();
    }

    std::string str_duration(Seconds const& s)
    {
        auto total = s.count();
        return fmt::format("{}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
    }
}
