#include <sl/active_completion_queue.hpp>
#include <sl/file_lease_store.hpp>
#include <sl/lease_election.hpp>
#include <sl/log.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace {
volatile std::sig_atomic_t interrupt = 0;
extern "C" void signal_handler(int) {
  interrupt = 1;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  if (argc < 3 or argc > 5) {
    std::cerr << "Usage: " << argv[0] << " <namespace> <store-directory> [timeout-ms] [interval-ms]" << std::endl;
    return 1;
  }
  sl::participant_options options;
  options.name_space = argv[1];
  std::string directory = argv[2];
  if (argc >= 4) {
    options.timeout = std::chrono::milliseconds(std::stol(argv[3]));
  }
  if (argc >= 5) {
    options.interval = std::chrono::milliseconds(std::stol(argv[4]));
  }

  sl::log::instance().add_sink(
      sl::make_log_sink([](sl::severity sev, std::string&& x) { std::cerr << x << std::endl; }));
  // ... SL_LOG_LEVEL=trace shows every reconciliation pass, if SL_MIN_SEVERITY allows it ...
  char const* level = std::getenv("SL_LOG_LEVEL");
  if (level != nullptr) {
    sl::log::instance().min_severity(sl::parse_severity(level));
  }

  options.on_become_leader = []() { std::cout << "this process is now the owner" << std::endl; };
  options.on_lose_leadership = []() { std::cout << "this process is no longer the owner" << std::endl; };
  options.on_other_detected = [](std::string const& owner_id) {
    std::cout << "the owner is " << owner_id << std::endl;
  };

  auto queue = std::make_shared<sl::active_completion_queue>();
  auto store = std::make_shared<sl::file_lease_store>(directory);
  if (not sl::lease_store_available(*store)) {
    std::cerr << "cannot use " << directory << " as a lease store" << std::endl;
    return 1;
  }
  sl::lease_election election(queue, options, store);
  std::cout << "participant " << election.id() << " joined " << election.storage_key() << std::endl;

  // ... block here until a signal is received ...
  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);
  using namespace std::chrono_literals;
  while (not interrupt) {
    std::this_thread::sleep_for(20ms);
  }

  // ... release the lease so the other processes do not wait for the timeout ...
  election.shutdown();
  std::cout << "participant " << election.id() << " left " << election.storage_key() << std::endl;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
