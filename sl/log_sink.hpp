#ifndef sl_log_sink_hpp
#define sl_log_sink_hpp

#include <sl/log_severity.hpp>

#include <memory>
#include <string>
#include <utility>

namespace sl {

/**
 * A destination for logging messages.
 *
 * Applications route Solo-Lease messages to their own logging system by registering one or more instances of
 * sl::log_sink with the global logger.
 */
class log_sink {
public:
  virtual ~log_sink() {}

  /**
   * Log the given message to the sink.
   *
   * @param sev the severity of the message.
   * @param message the formatted message, including the severity prefix and source location.
   */
  virtual void log(severity sev, std::string&& message) = 0;
};

/**
 * An adaptor that converts any Functor into a @c sl::log_sink.
 *
 * @tparam Functor the type of the functor to adapt, it must be callable as `f(sl::severity, std::string&&)`.
 */
template <typename Functor>
class log_to_functor : public log_sink {
public:
  explicit log_to_functor(Functor&& f)
      : functor_(std::move(f)) {
  }
  explicit log_to_functor(Functor const& f)
      : functor_(f) {
  }

  void log(severity sev, std::string&& message) override {
    functor_(sev, std::move(message));
  }

private:
  Functor functor_;
};

/**
 * Create a @c sl::log_sink shared pointer from a functor.
 *
 * @code
 * sl::log::instance().add_sink(sl::make_log_sink([](sl::severity, std::string&& x) { std::cerr << x << "\n"; }));
 * @endcode
 */
template <typename Functor>
std::shared_ptr<log_sink> make_log_sink(Functor&& f) {
  using functor_type = typename std::decay<Functor>::type;
  return std::make_shared<log_to_functor<functor_type>>(std::forward<Functor>(f));
}

} // namespace sl

#endif // sl_log_sink_hpp
