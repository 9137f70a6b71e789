#ifndef sl_file_lease_store_hpp
#define sl_file_lease_store_hpp

#include <sl/lease_store.hpp>

#include <string>

namespace sl {

/**
 * A lease store keeping each key in its own file under a directory.
 *
 * Lets participants in different processes on the same machine share leases.  Writes go to a temporary file that is
 * then renamed over the key file, so readers never see a partial record.  That makes each write atomic, but there is
 * still no compare-and-set: two processes can read the same record and both overwrite it.
 *
 * This store does not report changes, participants using it rely on polling (and on a broadcast bus, if any).
 */
class file_lease_store : public lease_store {
public:
  /**
   * Constructor.
   *
   * @param directory where the key files are kept, it must exist.
   * @throws std::runtime_error if @a directory is not a directory.
   */
  explicit file_lease_store(std::string directory);

  //@{
  /// @name implement the lease_store interface.
  bool get(std::string const& key, std::string& value) override;
  void set(std::string const& key, std::string const& value) override;
  void del(std::string const& key) override;
  //@}

  std::string const& directory() const {
    return directory_;
  }

  /**
   * The file holding @a key.
   *
   * @throws std::invalid_argument if @a key cannot be used as a file name.
   */
  std::string path(std::string const& key) const;

private:
  std::string directory_;
};

} // namespace sl

#endif // sl_file_lease_store_hpp
