#pragma once

#include <map>
#include <optional>
#include <string>

namespace qrapi::net {

// HTTP response, produced by HttpClient and by server route handlers
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }

  bool is_redirect() const {
    return status_code == 301 || status_code == 302 || status_code == 303 || status_code == 307 || status_code == 308;
  }

  // Case-insensitive header lookup
  std::optional<std::string> header(const std::string &name) const;
};

// Incoming request as seen by server route handlers
struct HttpRequest {
  std::string method;
  std::string target;  // raw request target, e.g. "/api/history?limit=5"
  std::string path;    // percent-decoded path without query
  std::map<std::string, std::string> query;
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;

  std::optional<std::string> header(const std::string &name) const;

  std::optional<std::string> query_param(const std::string &name) const;
};

// Canonical reason phrase for a status code ("OK", "Not Found", ...)
std::string status_reason(int status_code);

// Percent-decoding; '+' becomes a space when plus_as_space is set
std::string url_decode(const std::string &str, bool plus_as_space = false);

// Split "a=1&b=2" into a map, decoding keys and values
std::map<std::string, std::string> parse_query(const std::string &query);

}  // namespace qrapi::net
