#include "store/json_document_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>

#include "core/uuid.hpp"

namespace qrapi::store {

namespace fs = std::filesystem;

namespace {

// Collection names become file names
bool valid_collection_name(const std::string &name) {
  if (name.empty() || name.size() > 64) return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  });
}

}  // namespace

JsonDocumentStore::JsonDocumentStore(const fs::path &base_dir) : base_dir_(base_dir) {
  std::error_code ec;
  fs::create_directories(base_dir_, ec);
  if (ec) {
    spdlog::warn("Failed to create data directory {}: {}", base_dir_.string(), ec.message());
    return;
  }
  available_ = fs::is_directory(base_dir_, ec);
}

bool JsonDocumentStore::available() const {
  std::lock_guard lock(mutex_);
  std::error_code ec;
  return available_ && fs::is_directory(base_dir_, ec);
}

// --- Path helpers ---

fs::path JsonDocumentStore::collection_file(const std::string &collection) const {
  return base_dir_ / (collection + ".json");
}

// --- Atomic write ---

Result<bool> JsonDocumentStore::atomic_write(const fs::path &path, const std::string &content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    return Result<bool>::failure("failed to open temp file for writing: " + tmp_path.string());
  }

  file << content;
  file.close();

  if (file.fail()) {
    std::error_code ec;
    fs::remove(tmp_path, ec);
    return Result<bool>::failure("failed to write temp file: " + tmp_path.string());
  }

  std::error_code ec;
  fs::rename(tmp_path, path, ec);
  if (ec) {
    auto message = "failed to rename " + tmp_path.string() + " -> " + path.string() + ": " + ec.message();
    fs::remove(tmp_path, ec);
    return Result<bool>::failure(message);
  }
  return Result<bool>::success(true);
}

// --- Internal: {collection}.json ---

Result<std::vector<json>> JsonDocumentStore::load_collection(const std::string &collection) {
  auto path = collection_file(collection);
  std::error_code ec;
  bool exists = fs::exists(path, ec);
  if (ec) {
    return Result<std::vector<json>>::failure("cannot access " + path.string() + ": " + ec.message());
  }
  if (!exists) {
    return Result<std::vector<json>>::success({});
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<std::vector<json>>::failure("failed to open collection file: " + path.string());
  }

  try {
    json j = json::parse(file);
    if (!j.is_array()) {
      return Result<std::vector<json>>::failure("collection file is not an array: " + path.string());
    }
    std::vector<json> docs;
    docs.reserve(j.size());
    for (auto &doc : j) {
      docs.push_back(std::move(doc));
    }
    return Result<std::vector<json>>::success(std::move(docs));
  } catch (const std::exception &e) {
    return Result<std::vector<json>>::failure("failed to parse " + path.string() + ": " + e.what());
  }
}

Result<bool> JsonDocumentStore::save_collection(const std::string &collection, const std::vector<json> &docs) {
  json j = json::array();
  for (const auto &doc : docs) {
    j.push_back(doc);
  }
  return atomic_write(collection_file(collection), j.dump(2));
}

// --- DocumentStore interface ---

Result<DocumentId> JsonDocumentStore::create_document(const std::string &collection, const json &record) {
  if (!valid_collection_name(collection)) {
    return Result<DocumentId>::failure("invalid collection name: " + collection);
  }
  if (!record.is_object()) {
    return Result<DocumentId>::failure("document must be a JSON object");
  }

  std::lock_guard lock(mutex_);
  if (!available_) {
    return Result<DocumentId>::failure("store unavailable: " + base_dir_.string());
  }

  try {
    auto docs = load_collection(collection);
    if (!docs.ok()) {
      return Result<DocumentId>::failure(*docs.error);
    }

    auto id = UUID::generate();
    docs.value->push_back(detail::stamp_document(record, id));

    auto saved = save_collection(collection, *docs.value);
    if (!saved.ok()) {
      return Result<DocumentId>::failure(*saved.error);
    }
    return Result<DocumentId>::success(id);
  } catch (const std::exception &e) {
    return Result<DocumentId>::failure(std::string("create_document failed: ") + e.what());
  }
}

Result<std::vector<json>> JsonDocumentStore::get_documents(const std::string &collection, const json &filter, size_t limit) {
  if (!valid_collection_name(collection)) {
    return Result<std::vector<json>>::failure("invalid collection name: " + collection);
  }

  std::lock_guard lock(mutex_);
  if (!available_) {
    return Result<std::vector<json>>::failure("store unavailable: " + base_dir_.string());
  }

  try {
    auto docs = load_collection(collection);
    if (!docs.ok()) {
      return docs;
    }

    // Stored oldest first
    std::vector<json> result;
    for (auto it = docs.value->rbegin(); it != docs.value->rend() && result.size() < limit; ++it) {
      if (detail::matches_filter(*it, filter)) {
        result.push_back(std::move(*it));
      }
    }
    return Result<std::vector<json>>::success(std::move(result));
  } catch (const std::exception &e) {
    return Result<std::vector<json>>::failure(std::string("get_documents failed: ") + e.what());
  }
}

}  // namespace qrapi::store
