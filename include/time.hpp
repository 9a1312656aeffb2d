#ifndef QMANAGER_TIME_HPP
#define QMANAGER_TIME_HPP

#include <chrono>
#include <string>

namespace QManager{
    using Clock = std::chrono::system_clock;
    using Micros = std::chrono::microseconds;
    using Time_Point = std::chrono::time_point<Clock, Micros>;
    using Seconds = std::chrono::duration<long long int, std::ratio<1>>;

    // Current time, truncated to the microsecond resolution used on the wire.
    Time_Point now();

    long long int to_micros(Time_Point const& tp);
    Time_Point from_micros(long long int micros);

    std::string str_time();
    std::string str_time(Time_Point const& tp);
    std::string str_duration(Seconds const& s);
}

#endif //QMANAGER_TIME_HPP
