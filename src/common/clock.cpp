#include <confide/common/clock.hpp>

#include <chrono>

namespace confide::common {

confide::schema::timestamp_milliseconds_t system_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<confide::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace confide::common
