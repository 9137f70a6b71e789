#include "sl/identity.hpp"

#include <chrono>
#include <random>

namespace {
std::mt19937_64& generator() {
  thread_local std::mt19937_64 engine(std::random_device{}());
  return engine;
}
} // anonymous namespace

namespace sl {

std::string generate_participant_id() {
  static char const digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::uniform_int_distribution<int> pick(0, 35);

  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
  std::string id = "participant-" + std::to_string(now.count()) + "-";
  for (int i = 0; i != 9; ++i) {
    id.push_back(digits[pick(generator())]);
  }
  return id;
}

} // namespace sl
