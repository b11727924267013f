#include <xpii/common/clock.hpp>

#include <array>
#include <cstdio>
#include <ctime>

namespace xpii::common {

namespace {

std::tm to_utc(const std::chrono::system_clock::time_point tp) {
  auto seconds = std::chrono::system_clock::to_time_t(tp);
  auto out = std::tm{};
  gmtime_r(&seconds, &out);
  return out;
}

std::tm to_local(const std::chrono::system_clock::time_point tp) {
  auto seconds = std::chrono::system_clock::to_time_t(tp);
  auto out = std::tm{};
  localtime_r(&seconds, &out);
  return out;
}

std::string format_tm(const std::tm& value, const char* pattern) {
  auto buffer = std::array<char, 64>{};
  auto written = std::strftime(buffer.data(), buffer.size(), pattern, &value);
  return std::string{buffer.data(), written};
}

}  // namespace

clock_fn system_clock() {
  return [] { return std::chrono::system_clock::now(); };
}

std::string format_w3cdtf(const std::chrono::system_clock::time_point tp) {
  return format_tm(to_utc(tp), "%Y-%m-%dT%H:%M:%SZ");
}

std::string format_rfc3339_millis(
    const std::chrono::system_clock::time_point tp) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    tp.time_since_epoch())
                    .count() %
                1000;
  if (millis < 0) {
    millis += 1000;
  }
  auto out = format_tm(to_utc(tp), "%Y-%m-%dT%H:%M:%S");
  auto fraction = std::array<char, 8>{};
  std::snprintf(fraction.data(), fraction.size(), ".%03d",
                static_cast<int>(millis));
  out.append(fraction.data());
  out.push_back('Z');
  return out;
}

std::string format_local_compact(
    const std::chrono::system_clock::time_point tp) {
  return format_tm(to_local(tp), "%Y%m%d%H%M%S");
}

}  // namespace xpii::common
