#include <gatepass/common/clock.hpp>

#include <chrono>

namespace gatepass::common {

gatepass::schema::timestamp_milliseconds_t system_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<gatepass::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

clock_t system_clock() {
  return [] { return system_now(); };
}

}  // namespace gatepass::common
