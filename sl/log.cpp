#include "sl/log.hpp"

#include <algorithm>
#include <cstring>

namespace sl {

log& log::instance() {
  static log singleton;
  return singleton;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.push_back(std::move(sink));
}

void log::remove_sink(std::shared_ptr<log_sink> const& sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  // ... without the lock, a sink may log or change the sinks ...
  for (std::size_t i = 0; i < sinks.size(); ++i) {
    if (i + 1 == sinks.size()) {
      sinks[i]->log(sev, std::move(msg));
    } else {
      sinks[i]->log(sev, std::string(msg));
    }
  }
}

logger<false>::logger(severity sev, char const* function, char const* file, int line, log& sink)
    : stream_()
    , sev_(sev)
    , function_(function)
    , file_(file)
    , line_(line)
    , pending_(sev >= sink.min_severity()) {
  if (pending_) {
    stream_ << "[" << sev_ << "] ";
  }
}

void logger<false>::write_to(log& sink) {
  pending_ = false;
  char const* basename = std::strrchr(file_, '/');
  stream_ << " (" << function_ << " " << (basename == nullptr ? file_ : basename + 1) << ":" << line_ << ")";
  sink.write(sev_, stream_.str());
}

} // namespace sl
