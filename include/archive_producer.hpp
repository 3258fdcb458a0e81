/**
 * @file archive_producer.hpp
 * @brief Produces compressed mirror archives of hosted repositories.
 */

#ifndef ORGMIRRORBACKUP_ARCHIVE_PRODUCER_HPP
#define ORGMIRRORBACKUP_ARCHIVE_PRODUCER_HPP

#include "models.hpp"
#include "process.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace omb {

/// Local archive ready for upload.
struct ArchiveArtifact {
  std::filesystem::path path;
  std::uint64_t size_bytes{0};
  std::string default_branch;
};

/** Creates a full-history archive of one repository. */
class ArchiveProducer {
public:
  virtual ~ArchiveProducer() = default;

  /**
   * Package @p repository below @p work_dir.
   *
   * @throws ArchiveError When cloning or packaging fails.
   */
  virtual ArchiveArtifact produce(const RepositoryDescriptor &repository,
                                  const std::filesystem::path &work_dir) = 0;
};

/**
 * ArchiveProducer running `git clone --mirror` followed by `tar -czf`.
 *
 * The access token reaches git as an `http.extraHeader` set through the
 * `GIT_CONFIG_*` environment, so it stays out of the command line and out of
 * the mirror's `config`, and therefore out of the archive. It never appears
 * in log output or errors.
 */
class GitMirrorArchiver : public ArchiveProducer {
public:
  /**
   * @param token Access token for HTTPS clones, may be empty.
   * @param runner Subprocess runner; a SpawnProcessRunner when null.
   */
  explicit GitMirrorArchiver(std::string token,
                             std::shared_ptr<ProcessRunner> runner = nullptr);

  ArchiveArtifact produce(const RepositoryDescriptor &repository,
                          const std::filesystem::path &work_dir) override;

private:
  std::vector<std::string> clone_environment() const;
  std::string redact(std::string text) const;

  std::string token_;
  std::string credential_; ///< base64 of `x-access-token:<token>`
  std::shared_ptr<ProcessRunner> runner_;
};

} // namespace omb

#endif // ORGMIRRORBACKUP_ARCHIVE_PRODUCER_HPP
