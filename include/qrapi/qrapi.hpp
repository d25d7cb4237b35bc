#pragma once

// Core types
#include "core/color.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Imaging
#include "image/image.hpp"
#include "image/codec.hpp"

// QR pipeline
#include "qr/composer.hpp"
#include "qr/logo_fetcher.hpp"
#include "qr/qr_encoder.hpp"

// Persistence
#include "store/document_store.hpp"
#include "store/json_document_store.hpp"

// Network
#include "net/http_client.hpp"
#include "net/http_server.hpp"

// Service
#include "service/models.hpp"
#include "service/qr_service.hpp"
#include "service/routes.hpp"

namespace qrapi {

// Initialize logging from the config
void init(const Config &config);

// Flush and drop loggers
void shutdown();

// Get version string
std::string version();

}  // namespace qrapi
