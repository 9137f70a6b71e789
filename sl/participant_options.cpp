#include "sl/participant_options.hpp"
#include <sl/assert_throw.hpp>

namespace sl {

void participant_options::validate() const {
  SL_ASSERT_THROW(not name_space.empty());
  SL_ASSERT_THROW(not key_prefix.empty());
  SL_ASSERT_THROW(timeout.count() > 0);
  SL_ASSERT_THROW(interval.count() > 0);
  SL_ASSERT_THROW(debounce.count() >= 0);
}

} // namespace sl
