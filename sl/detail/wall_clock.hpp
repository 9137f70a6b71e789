#ifndef sl_detail_wall_clock_hpp
#define sl_detail_wall_clock_hpp

#include <chrono>
#include <cstdint>

namespace sl {
namespace detail {
/**
 * The clock used to timestamp lease records.
 *
 * Records are compared across processes, so this is the wall clock in milliseconds since the epoch.  The tests replace
 * it with a clock they control.
 */
struct wall_clock {
  std::int64_t now_ms() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  }
};
} // namespace detail
} // namespace sl

#endif // sl_detail_wall_clock_hpp
