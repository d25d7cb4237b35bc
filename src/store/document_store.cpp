#include "store/document_store.hpp"

#include "core/uuid.hpp"

namespace qrapi::store {

namespace detail {

json stamp_document(const json &record, const DocumentId &id) {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

  json doc = record;
  doc["_id"] = id;
  doc["created_at"] = now;
  doc["updated_at"] = now;
  return doc;
}

bool matches_filter(const json &doc, const json &filter) {
  if (!filter.is_object()) return true;

  for (auto it = filter.begin(); it != filter.end(); ++it) {
    auto field = doc.find(it.key());
    if (field == doc.end() || *field != it.value()) {
      return false;
    }
  }
  return true;
}

}  // namespace detail

Result<DocumentId> InMemoryDocumentStore::create_document(const std::string &collection, const json &record) {
  if (!record.is_object()) {
    return Result<DocumentId>::failure("document must be a JSON object");
  }

  auto id = UUID::generate();
  std::lock_guard lock(mutex_);
  collections_[collection].push_back(detail::stamp_document(record, id));
  return Result<DocumentId>::success(id);
}

Result<std::vector<json>> InMemoryDocumentStore::get_documents(const std::string &collection, const json &filter, size_t limit) {
  std::lock_guard lock(mutex_);

  std::vector<json> result;
  auto it = collections_.find(collection);
  if (it == collections_.end()) {
    return Result<std::vector<json>>::success(std::move(result));
  }

  const auto &docs = it->second;
  for (auto doc = docs.rbegin(); doc != docs.rend() && result.size() < limit; ++doc) {
    if (detail::matches_filter(*doc, filter)) {
      result.push_back(*doc);
    }
  }
  return Result<std::vector<json>>::success(std::move(result));
}

}  // namespace qrapi::store
