#include "file_stores.hpp"

#include "logger.hpp"

#include <deque>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace presenceguard {

using json = nlohmann::json;

FileEnrollmentStore::FileEnrollmentStore(std::string users_dir,
                                         std::size_t expected_dim,
                                         std::string model_version)
    : users_dir_(std::move(users_dir)), expected_dim_(expected_dim),
      model_version_(std::move(model_version)) {}

void FileEnrollmentStore::requireDirectory() const {
  std::error_code ec;
  if (!fs::is_directory(users_dir_, ec))
    throw StoreError("enrollment store unreachable: " + users_dir_);
}

EnrolledSet FileEnrollmentStore::load(const std::string &identity,
                                      const std::string &file_path) const {
  EnrolledSet set;
  std::ifstream f(file_path);
  if (!f.is_open())
    throw StoreError("cannot read enrollment file " + file_path);

  json j = json::parse(f, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    Logger::log(LogLevel::ERROR,
                "Enrollment file for " + identity + " is corrupted");
    set.excluded = 1;
    return set;
  }

  auto take = [&](const json &data, std::size_t index) {
    auto e = Embedding::fromJson(data, expected_dim_);
    if (!e) {
      Logger::log(LogLevel::WARN, "Invalid embedding " +
                                      std::to_string(index + 1) + " for " +
                                      identity + ": " + e.detail());
      set.excluded++;
      return;
    }
    set.embeddings.push_back(std::move(e.value()));
  };

  if (j.contains("embeddings") && j["embeddings"].is_array()) {
    std::size_t index = 0;
    for (const auto &entry : j["embeddings"]) {
      if (!entry.is_object() || !entry.contains("data")) {
        set.excluded++;
      } else if (!model_version_.empty() && entry.contains("model_version") &&
                 entry["model_version"] != model_version_) {
        Logger::log(LogLevel::WARN,
                    "Skipping embedding " + std::to_string(index + 1) +
                        " for " + identity + ": model version " +
                        entry["model_version"].dump() + " != " +
                        model_version_);
        set.excluded++;
      } else {
        take(entry["data"], index);
      }
      index++;
    }
  } else if (j.contains("embedding")) {
    take(j["embedding"], 0);
  }
  return set;
}

EnrolledSet FileEnrollmentStore::getEmbeddings(const std::string &identity) {
  requireDirectory();
  if (!isValidIdentity(identity)) {
    Logger::log(LogLevel::WARN, "Invalid identity string: " + identity);
    return {};
  }
  std::string path = users_dir_ + "/" + identity + ".json";
  if (!fs::exists(path))
    return {};
  return load(identity, path);
}

std::map<std::string, std::vector<Embedding>>
FileEnrollmentStore::getAllEmbeddings() {
  requireDirectory();
  std::map<std::string, std::vector<Embedding>> all;
  for (const auto &entry : fs::directory_iterator(users_dir_)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json")
      continue;
    std::string identity = entry.path().stem().string();
    if (!isValidIdentity(identity))
      continue;
    all[identity] = load(identity, entry.path().string()).embeddings;
  }
  return all;
}

FileAttemptLedger::FileAttemptLedger(std::string ledger_dir)
    : ledger_dir_(std::move(ledger_dir)) {}

std::string FileAttemptLedger::pathFor(const std::string &identity) const {
  return ledger_dir_ + "/" + identity + ".jsonl";
}

AttemptWindow FileAttemptLedger::getRecentAttempts(const std::string &identity,
                                                   std::size_t window) {
  AttemptWindow result;
  std::error_code ec;
  if (!fs::is_directory(ledger_dir_, ec))
    throw StoreError("attempt ledger unreachable: " + ledger_dir_);
  if (!isValidIdentity(identity))
    return result;

  std::ifstream f(pathFor(identity));
  if (!f.is_open())
    return result;

  // Keep only the trailing window of lines
  std::deque<std::string> lines;
  std::string line;
  while (std::getline(f, line)) {
    if (line.empty())
      continue;
    lines.push_back(line);
    if (lines.size() > window)
      lines.pop_front();
  }

  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    json j = json::parse(*it, nullptr, false);
    auto record = parseAttemptRecord(j);
    if (!record) {
      result.skipped++;
      Logger::log(LogLevel::WARN, "Skipping ledger record for " + identity +
                                      ": " + record.detail());
      continue;
    }
    result.records.push_back(record.value());
  }
  return result;
}

void FileAttemptLedger::append(const std::string &identity,
                               const json &record) {
  if (!isValidIdentity(identity))
    throw StoreError("refusing to write ledger for invalid identity");
  std::error_code ec;
  fs::create_directories(ledger_dir_, ec);
  std::ofstream f(pathFor(identity), std::ios::app);
  if (!f.is_open())
    throw StoreError("cannot append to ledger " + pathFor(identity));
  f << record.dump() << "\n";
}

} // namespace presenceguard
