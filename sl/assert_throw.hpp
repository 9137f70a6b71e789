#ifndef sl_assert_throw_hpp
#define sl_assert_throw_hpp
/**
 * @file
 *
 * Define a macro to check preconditions at runtime.
 */

#ifndef SL_ASSERT_THROW
/**
 * Check the predicate @a P and if false raises std::invalid_argument describing the problem.
 */
#define SL_ASSERT_THROW(P)                                                                                             \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      sl::assert_throw_impl(#P, __func__, __FILE__, __LINE__);                                                         \
    }                                                                                                                  \
  } while (false)
#endif // SL_ASSERT_THROW

namespace sl {

/**
 * Implement the @c SL_ASSERT_THROW macro out-of-line.
 *
 * @param what the text description of the predicate
 * @param function the function where the predicate was asserted.
 * @param filename the source file where the predicate was asserted.
 * @param lineno the line number where the predicate was asserted.
 */
[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno);
} // namespace sl

#endif // sl_assert_throw_hpp
