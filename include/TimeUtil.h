#pragma once
#include <string>
#include <chrono>
#include <ctime>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <filesystem>

// C++17 has no clock_cast: shift file_clock into system_clock via "now" on both clocks.
inline int64_t to_epoch_ms(std::filesystem::file_time_type ftime) {
    using namespace std::chrono;
    auto sys = time_point_cast<system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + system_clock::now());
    return duration_cast<milliseconds>(sys.time_since_epoch()).count();
}

// ISO-8601 UTC with milliseconds: 2024-03-01T09:15:22.123Z
inline std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto t = system_clock::to_time_t(tp);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

inline std::string iso8601_now() {
    return iso8601_utc(std::chrono::system_clock::now());
}
