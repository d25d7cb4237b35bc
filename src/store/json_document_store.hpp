#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

#include "store/document_store.hpp"

namespace qrapi::store {

// JSON file-based document store
// Storage layout:
//   base_dir/
//     {collection}.json  array of documents, oldest first
class JsonDocumentStore : public DocumentStore {
 public:
  explicit JsonDocumentStore(const std::filesystem::path &base_dir);

  // DocumentStore interface
  Result<DocumentId> create_document(const std::string &collection, const json &record) override;
  Result<std::vector<json>> get_documents(const std::string &collection, const json &filter, size_t limit) override;
  bool available() const override;

  std::string name() const override {
    return "json";
  }

  const std::filesystem::path &base_dir() const {
    return base_dir_;
  }

 private:
  std::filesystem::path base_dir_;
  bool available_ = false;
  mutable std::mutex mutex_;

  // Path helpers
  std::filesystem::path collection_file(const std::string &collection) const;

  // Atomic write: write to .tmp then rename
  Result<bool> atomic_write(const std::filesystem::path &path, const std::string &content);

  // Internal: load/save {collection}.json
  Result<std::vector<json>> load_collection(const std::string &collection);
  Result<bool> save_collection(const std::string &collection, const std::vector<json> &docs);
};

}  // namespace qrapi::store
