#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/types.hpp"

namespace qrapi::store {

// Document persistence interface
//
// A document is a JSON object stored in a named collection. Inserting assigns
// "_id", "created_at" and "updated_at". Every operation reports failure through
// Result; implementations never throw across this boundary.
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  // Insert one document, returns its id
  virtual Result<DocumentId> create_document(const std::string &collection, const json &record) = 0;

  // Up to `limit` documents whose fields equal every field of `filter`
  // (empty object = all), newest first
  virtual Result<std::vector<json>> get_documents(const std::string &collection, const json &filter, size_t limit) = 0;

  virtual bool available() const = 0;

  virtual std::string name() const = 0;
};

// Shared helpers for implementations
namespace detail {

// Copy of record with "_id" and timestamps stamped in
json stamp_document(const json &record, const DocumentId &id);

// True if every key of filter is present in doc with an equal value
bool matches_filter(const json &doc, const json &filter);

}  // namespace detail

// In-memory document store
class InMemoryDocumentStore : public DocumentStore {
 public:
  Result<DocumentId> create_document(const std::string &collection, const json &record) override;
  Result<std::vector<json>> get_documents(const std::string &collection, const json &filter, size_t limit) override;

  bool available() const override {
    return true;
  }

  std::string name() const override {
    return "memory";
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<json>> collections_;
};

}  // namespace qrapi::store
