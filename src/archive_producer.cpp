#include "archive_producer.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> archive_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("archive");
  }();
  return logger;
}

} // namespace

GitMirrorArchiver::GitMirrorArchiver(std::string token,
                                     std::shared_ptr<ProcessRunner> runner)
    : token_(std::move(token)),
      runner_(runner ? std::move(runner)
                     : std::make_shared<SpawnProcessRunner>()) {
  if (!token_.empty()) {
    std::string userinfo = "x-access-token:" + token_;
    credential_ = base64_encode(
        std::vector<unsigned char>(userinfo.begin(), userinfo.end()));
  }
}

std::vector<std::string> GitMirrorArchiver::clone_environment() const {
  std::vector<std::string> env{"GIT_TERMINAL_PROMPT=0"};
  if (credential_.empty())
    return env;
  // Command-scoped config is never written to the mirror's config file.
  env.push_back("GIT_CONFIG_COUNT=1");
  env.push_back("GIT_CONFIG_KEY_0=http.extraHeader");
  env.push_back("GIT_CONFIG_VALUE_0=Authorization: Basic " + credential_);
  return env;
}

std::string GitMirrorArchiver::redact(std::string text) const {
  for (const auto *secret : {&credential_, &token_}) {
    if (secret->empty())
      continue;
    for (auto pos = text.find(*secret); pos != std::string::npos;
         pos = text.find(*secret, pos + 3)) {
      text.replace(pos, secret->size(), "***");
    }
  }
  return text;
}

ArchiveArtifact
GitMirrorArchiver::produce(const RepositoryDescriptor &repository,
                           const std::filesystem::path &work_dir) {
  if (repository.clone_url.empty()) {
    throw ArchiveError("No clone URL for " + repository.full_name);
  }
  std::filesystem::path mirror = work_dir / repository.name;
  std::filesystem::path archive = work_dir / (repository.name + ".tar.gz");

  archive_log()->info("Cloning repository: {}", repository.clone_url);
  ProcessResult clone;
  try {
    clone = runner_->run(
        {"git", "clone", "--mirror", repository.clone_url, mirror.string()},
        clone_environment());
  } catch (const std::exception &e) {
    throw ArchiveError(redact(e.what()));
  }
  if (clone.exit_code != 0) {
    std::string detail = redact(clone.error_output);
    archive_log()->error("git clone of {} failed ({}): {}",
                         repository.full_name, clone.exit_code, detail);
    throw ArchiveError("git clone --mirror failed for " +
                       repository.full_name + ": " + detail);
  }

  archive_log()->info("Creating archive: {}", archive.string());
  ProcessResult tar;
  try {
    tar = runner_->run({"tar", "-czf", archive.string(), "-C",
                        work_dir.string(), repository.name});
  } catch (const std::exception &e) {
    throw ArchiveError(e.what());
  }
  if (tar.exit_code != 0) {
    archive_log()->error("tar of {} failed ({}): {}", repository.full_name,
                         tar.exit_code, tar.error_output);
    throw ArchiveError("tar failed for " + repository.full_name + ": " +
                       tar.error_output);
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(archive, ec);
  if (ec) {
    throw ArchiveError("Archive missing after tar for " +
                       repository.full_name + ": " + ec.message());
  }
  archive_log()->debug("Archive for {} is {} bytes", repository.full_name,
                       size);
  return {archive, static_cast<std::uint64_t>(size),
          repository.default_branch};
}

} // namespace omb
