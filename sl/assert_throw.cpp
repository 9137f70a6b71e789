#include "sl/assert_throw.hpp"

#include <sstream>
#include <stdexcept>

namespace sl {

[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno) {
  std::ostringstream os;
  os << "precondition (" << what << ") was not true in " << function << " @ (" << filename << ":" << lineno << ")";
  throw std::invalid_argument(os.str());
}

} // namespace sl
