#include <sl/detail/print_to_stream.hpp>
#include <sl/file_lease_store.hpp>
#include <sl/lease_record_codec.hpp>
#include <sl/participant_options.hpp>

#include <chrono>
#include <iostream>

int main(int argc, char* argv[]) try {
  if (argc != 3 and argc != 4) {
    std::cerr << "Usage: " << argv[0] << " <namespace> <store-directory> [timeout-ms]" << std::endl;
    return 1;
  }
  sl::participant_options options;
  options.name_space = argv[1];
  if (argc == 4) {
    options.timeout = std::chrono::milliseconds(std::stol(argv[3]));
  }
  sl::file_lease_store store(argv[2]);

  std::string value;
  if (not store.get(options.storage_key(), value)) {
    std::cout << options.storage_key() << ": no current owner" << std::endl;
    return 0;
  }
  slpb::LeaseRecord record;
  if (not sl::decode_lease_record(value, record)) {
    std::cout << options.storage_key() << ": malformed record <" << value << ">" << std::endl;
    return 0;
  }
  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
  auto age = now.count() - record.acquired_at();
  std::cout << options.storage_key() << ": " << sl::detail::print_to_stream(record) << " age=" << age << "ms"
            << (age > options.timeout.count() ? " (expired)" : "") << std::endl;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
