#ifndef sl_detail_null_stream_hpp
#define sl_detail_null_stream_hpp

namespace sl {
namespace detail {
/**
 * Implements operator<< for all types, without any effect.
 *
 * SL_LOG() returns an object of this class when the level is disabled at compile-time, so the streaming expression
 * compiles but nothing is evaluated into a string.
 */
struct null_stream {
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }

  null_stream& operator<<(char const*) {
    return *this;
  }
};

} // namespace detail
} // namespace sl

#endif // sl_detail_null_stream_hpp
