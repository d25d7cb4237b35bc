#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qr/logo_fetcher.hpp"
#include "service/models.hpp"
#include "store/document_store.hpp"

namespace qrapi::service {

struct GeneratedImage {
  std::string png;
  int width = 0;
  int height = 0;
  bool logo_applied = false;
};

// QR generation and history operations behind the HTTP routes
//
// Both collaborators are optional: without a store nothing is persisted and
// history is empty, without a logo source logo_url is ignored.
class QrService {
 public:
  QrService(std::shared_ptr<store::DocumentStore> store, std::shared_ptr<qr::LogoSource> logos);

  // Validate, render, persist (best effort) and encode as PNG
  std::optional<ApiError> generate(const GenerationRequest &req, GeneratedImage &out);

  // Newest first, at most `limit` records; empty on any store failure
  std::vector<HistoryRecord> history(int limit);

  // Liveness and store connectivity, as returned by GET /test
  json status() const;

 private:
  std::shared_ptr<store::DocumentStore> store_;
  std::shared_ptr<qr::LogoSource> logos_;
};

}  // namespace qrapi::service
