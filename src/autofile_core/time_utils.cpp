#include "autofile_core/time_utils.hpp"

#include <iomanip>
#include <sstream>

namespace autofile_core {

std::tm to_local_tm(std::time_t t) {
  std::tm tm_struct = {};
#if defined(_WIN32)
  localtime_s(&tm_struct, &t);
#else
  localtime_r(&t, &tm_struct);
#endif
  return tm_struct;
}

std::string format_local_time(const std::chrono::system_clock::time_point& tp,
                              const char* format) {
  std::tm tm_struct = to_local_tm(std::chrono::system_clock::to_time_t(tp));
  std::stringstream ss;
  ss << std::put_time(&tm_struct, format);
  return ss.str();
}

std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type ftime) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

}  // namespace autofile_core
