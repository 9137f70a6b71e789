#ifndef sl_identity_hpp
#define sl_identity_hpp

#include <string>

namespace sl {
/**
 * Generate a new participant id.
 *
 * The ids look like `participant-<milliseconds since the epoch>-<9 random base 36 characters>`.  They are opaque to
 * the election protocol, which only compares them for equality, and are assumed to be unique.
 */
std::string generate_participant_id();
} // namespace sl

#endif // sl_identity_hpp
