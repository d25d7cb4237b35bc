#include "net/http_message.hpp"

#include "core/types.hpp"

namespace qrapi::net {

std::optional<std::string> HttpResponse::header(const std::string &name) const {
  auto wanted = to_lower(name);
  for (const auto &[key, value] : headers) {
    if (to_lower(key) == wanted) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<std::string> HttpRequest::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  if (it != headers.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<std::string> HttpRequest::query_param(const std::string &name) const {
  auto it = query.find(name);
  if (it != query.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::string status_reason(int status_code) {
  switch (status_code) {
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 204:
      return "No Content";
    case 301:
      return "Moved Permanently";
    case 302:
      return "Found";
    case 303:
      return "See Other";
    case 307:
      return "Temporary Redirect";
    case 308:
      return "Permanent Redirect";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 408:
      return "Request Timeout";
    case 411:
      return "Length Required";
    case 413:
      return "Payload Too Large";
    case 422:
      return "Unprocessable Entity";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
  }
  return "Unknown";
}

std::string url_decode(const std::string &str, bool plus_as_space) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  std::string out;
  out.reserve(str.size());
  for (size_t i = 0; i < str.size(); ++i) {
    char c = str[i];
    if (c == '%' && i + 2 < str.size()) {
      int hi = hex(str[i + 1]);
      int lo = hex(str[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::map<std::string, std::string> parse_query(const std::string &query) {
  std::map<std::string, std::string> params;

  size_t pos = 0;
  while (pos <= query.size()) {
    auto amp = query.find('&', pos);
    if (amp == std::string::npos) amp = query.size();

    auto pair = query.substr(pos, amp - pos);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      auto key = url_decode(pair.substr(0, eq), true);
      auto value = eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1), true);
      // First occurrence wins
      params.emplace(std::move(key), std::move(value));
    }

    pos = amp + 1;
  }

  return params;
}

}  // namespace qrapi::net
