/**
 * @file work_dir.hpp
 * @brief Private temporary directory removed when it goes out of scope.
 */

#ifndef ORGMIRRORBACKUP_WORK_DIR_HPP
#define ORGMIRRORBACKUP_WORK_DIR_HPP

#include <filesystem>
#include <string>

namespace omb {

/**
 * Creates a uniquely named directory below a parent and removes it with all
 * its contents on destruction, whichever way the owning scope is left.
 */
class ScopedWorkDir {
public:
  /**
   * @param parent Directory to create the work area in. The system temporary
   *        directory is used when empty.
   * @param label Human readable fragment included in the directory name.
   * @throws std::runtime_error When the directory cannot be created.
   */
  explicit ScopedWorkDir(const std::filesystem::path &parent = {},
                         const std::string &label = "omb");
  ~ScopedWorkDir();

  ScopedWorkDir(const ScopedWorkDir &) = delete;
  ScopedWorkDir &operator=(const ScopedWorkDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace omb

#endif // ORGMIRRORBACKUP_WORK_DIR_HPP
