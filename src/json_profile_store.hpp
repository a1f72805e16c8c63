#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "ssh_session_manager.hpp"

// SSH profiles kept in a JSON array on disk. Writes go to a temporary file
// that is renamed over the old one.
class JsonProfileStore : public SshProfileStore {
public:
  explicit JsonProfileStore(std::filesystem::path path,
                            std::shared_ptr<Logger> logger = nullptr);

  std::vector<SshProfile> load(std::string& error) override;
  bool save(const std::vector<SshProfile>& profiles, std::string& error) override;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
};
