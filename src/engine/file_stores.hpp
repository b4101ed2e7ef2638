#pragma once

#include "capabilities.hpp"

#include <cstddef>
#include <string>

namespace presenceguard {

// Enrollment store backed by <users_dir>/<identity>.json:
//   {"embeddings": [{"label", "data", "created", "model_version"}, ...]}
// The legacy single "embedding" key is still read.
class FileEnrollmentStore : public EnrollmentStore {
public:
  // Entries whose model_version differs from `model_version` are excluded;
  // an empty `model_version` accepts all.
  FileEnrollmentStore(std::string users_dir, std::size_t expected_dim = 0,
                      std::string model_version = "");

  EnrolledSet getEmbeddings(const std::string &identity) override;
  std::map<std::string, std::vector<Embedding>> getAllEmbeddings() override;

private:
  EnrolledSet load(const std::string &identity,
                   const std::string &file_path) const;
  void requireDirectory() const;

  std::string users_dir_;
  std::size_t expected_dim_;
  std::string model_version_;
};

// Append-only ledger, one JSON record per line in
// <ledger_dir>/<identity>.jsonl.
class FileAttemptLedger : public AttemptLedger {
public:
  explicit FileAttemptLedger(std::string ledger_dir);

  AttemptWindow getRecentAttempts(const std::string &identity,
                                  std::size_t window) override;
  void append(const std::string &identity,
              const nlohmann::json &record) override;

private:
  std::string pathFor(const std::string &identity) const;

  std::string ledger_dir_;
};

} // namespace presenceguard
