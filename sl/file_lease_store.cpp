#include "sl/file_lease_store.hpp"
#include <sl/log.hpp>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <sys/stat.h>
#include <unistd.h>

namespace {
/// Format an error from a failed C library call.
std::string io_error(char const* what, std::string const& path, int err) {
  std::ostringstream os;
  os << "file_lease_store: " << what << " failed for " << path << ": " << std::strerror(err) << " [" << err << "]";
  return os.str();
}

struct file_closer {
  void operator()(std::FILE* f) const {
    (void)std::fclose(f);
  }
};
using file_ptr = std::unique_ptr<std::FILE, file_closer>;

std::atomic<long> temporary_counter(0);
} // anonymous namespace

namespace sl {

file_lease_store::file_lease_store(std::string directory)
    : directory_(std::move(directory)) {
  struct stat st;
  if (::stat(directory_.c_str(), &st) != 0) {
    throw std::runtime_error(io_error("stat()", directory_, errno));
  }
  if (not S_ISDIR(st.st_mode)) {
    throw std::runtime_error("file_lease_store: " + directory_ + " is not a directory");
  }
}

std::string file_lease_store::path(std::string const& key) const {
  if (key.empty() or key == "." or key == ".." or key.find('/') != std::string::npos) {
    throw std::invalid_argument("file_lease_store: invalid key <" + key + ">");
  }
  return directory_ + "/" + key;
}

bool file_lease_store::get(std::string const& key, std::string& value) {
  auto const filename = path(key);
  file_ptr f(std::fopen(filename.c_str(), "rb"));
  if (not f) {
    if (errno == ENOENT) {
      return false;
    }
    throw std::runtime_error(io_error("fopen()", filename, errno));
  }
  std::string contents;
  char buffer[4096];
  std::size_t n = 0;
  while ((n = std::fread(buffer, 1, sizeof(buffer), f.get())) > 0) {
    contents.append(buffer, n);
  }
  if (std::ferror(f.get())) {
    throw std::runtime_error(io_error("fread()", filename, errno));
  }
  value.swap(contents);
  return true;
}

void file_lease_store::set(std::string const& key, std::string const& value) {
  auto const filename = path(key);
  std::ostringstream os;
  os << filename << ".tmp-" << ::getpid() << "-" << ++temporary_counter;
  auto const temporary = os.str();
  {
    file_ptr f(std::fopen(temporary.c_str(), "wb"));
    if (not f) {
      throw std::runtime_error(io_error("fopen()", temporary, errno));
    }
    if (std::fwrite(value.data(), 1, value.size(), f.get()) != value.size() or std::fflush(f.get()) != 0) {
      int err = errno;
      f.reset();
      (void)std::remove(temporary.c_str());
      throw std::runtime_error(io_error("fwrite()", temporary, err));
    }
  }
  if (std::rename(temporary.c_str(), filename.c_str()) != 0) {
    int err = errno;
    (void)std::remove(temporary.c_str());
    throw std::runtime_error(io_error("rename()", filename, err));
  }
  SL_LOG(trace) << "file_lease_store set " << filename << " (" << value.size() << " bytes)";
}

void file_lease_store::del(std::string const& key) {
  auto const filename = path(key);
  if (std::remove(filename.c_str()) != 0 and errno != ENOENT) {
    throw std::runtime_error(io_error("remove()", filename, errno));
  }
}

} // namespace sl
