#include "artifact_store.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>

#include "types.hpp"

namespace fs = std::filesystem;

DirectoryArtifactStore::DirectoryArtifactStore(ExportConfig config) : config_(std::move(config)) {}

std::string DirectoryArtifactStore::store(const std::string& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw std::runtime_error("artifact source missing: " + path);
  }
  fs::create_directories(config_.directory, ec);
  if (ec) {
    throw std::runtime_error(
        fmt::format("cannot create export directory {}: {}", config_.directory, ec.message()));
  }

  std::string id = fmt::format("{}_{:04d}_{}", format_wall_time(WallClock::now(), "%Y%m%d%H%M%S"),
                               counter_.fetch_add(1) + 1, fs::path(path).filename().string());
  fs::path dest = fs::path(config_.directory) / id;
  fs::copy_file(path, dest, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw std::runtime_error(fmt::format("copy to {} failed: {}", dest.string(), ec.message()));
  }
  spdlog::info("Stored artifact {} ({} bytes)", id, fs::file_size(dest, ec));
  return id;
}

std::string DirectoryArtifactStore::fetchUrl(const std::string& identifier) const {
  fs::path p = fs::path(config_.directory) / identifier;
  std::error_code ec;
  if (!fs::exists(p, ec)) throw std::runtime_error("unknown artifact: " + identifier);
  if (!config_.base_url.empty()) {
    std::string base = config_.base_url;
    if (base.back() != '/') base += '/';
    return base + identifier;
  }
  return "file://" + fs::absolute(p, ec).string();
}
