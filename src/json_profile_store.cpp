#include "json_profile_store.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace {

nlohmann::json to_json(const SshProfile& profile) {
  return {
    {"id", profile.id},
    {"name", profile.name},
    {"host", profile.host},
    {"port", profile.port},
    {"username", profile.username},
    {"key_path", profile.key_path}
  };
}

SshProfile from_json(const nlohmann::json& j) {
  SshProfile profile;
  profile.id = j.at("id").get<std::string>();
  profile.name = j.value("name", "");
  profile.host = j.at("host").get<std::string>();
  profile.port = j.value("port", static_cast<uint16_t>(22));
  profile.username = j.value("username", "");
  profile.key_path = j.value("key_path", "");
  return profile;
}

} // namespace

JsonProfileStore::JsonProfileStore(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("profiles")) {}

std::vector<SshProfile> JsonProfileStore::load(std::string& error) {
  error.clear();
  std::vector<SshProfile> out;
  std::error_code ec;
  if(!std::filesystem::exists(path_, ec)) return out;

  std::ifstream in(path_);
  if(!in) {
    error = "cannot read " + path_.string();
    return out;
  }
  try {
    nlohmann::json doc;
    in >> doc;
    if(!doc.is_array()) {
      error = path_.string() + " is not a JSON array";
      return out;
    }
    for(const auto& entry : doc) {
      try {
        out.push_back(from_json(entry));
      } catch(const nlohmann::json::exception& e) {
        logger_->warn("Skipping invalid profile in {}: {}", path_.string(), e.what());
      }
    }
  } catch(const nlohmann::json::exception& e) {
    error = "failed to parse " + path_.string() + ": " + e.what();
    out.clear();
  }
  return out;
}

bool JsonProfileStore::save(const std::vector<SshProfile>& profiles, std::string& error) {
  error.clear();
  std::error_code ec;
  if(path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  nlohmann::json doc = nlohmann::json::array();
  for(const auto& profile : profiles) doc.push_back(to_json(profile));

  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      error = "cannot write " + tmp.string();
      return false;
    }
    out << doc.dump(2);
    if(!out) {
      error = "short write to " + tmp.string();
      return false;
    }
  }
  std::filesystem::rename(tmp, path_, ec);
  if(ec) {
    error = "cannot replace " + path_.string() + ": " + ec.message();
    return false;
  }
  logger_->debug("saved {} profile(s) to {}", profiles.size(), path_.string());
  return true;
}
