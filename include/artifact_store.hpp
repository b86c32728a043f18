#pragma once

#include <atomic>
#include <cstdint>
#include <string>

struct ExportConfig {
  std::string directory = "exports";
  std::string base_url;  // empty: file:// URLs
};

// Destination for converted recordings. Not assumed idempotent: callers use
// a fresh identifier per attempt. Both operations throw std::exception on failure.
class ArtifactStore {
public:
  virtual ~ArtifactStore() = default;
  virtual std::string store(const std::string& path) = 0;
  virtual std::string fetchUrl(const std::string& identifier) const = 0;
};

// Copies artifacts into a local export directory (an NFS mount or a synced
// folder in deployments).
class DirectoryArtifactStore : public ArtifactStore {
public:
  explicit DirectoryArtifactStore(ExportConfig config);

  std::string store(const std::string& path) override;
  std::string fetchUrl(const std::string& identifier) const override;

private:
  ExportConfig config_;
  std::atomic<uint64_t> counter_{0};
};
