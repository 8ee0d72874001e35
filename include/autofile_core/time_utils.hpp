#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>

namespace autofile_core {

std::tm to_local_tm(std::time_t t);

// strftime-style formatting in local time, e.g. "%Y%m%d".
std::string format_local_time(const std::chrono::system_clock::time_point& tp,
                              const char* format);

std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type ftime);

}  // namespace autofile_core
