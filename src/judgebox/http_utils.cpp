#include "http_utils.h"

#include <fmt/ranges.h>
#include "judgebox/utils.h"

namespace http_utils {

bool IsSecretKey(const std::string& key) {
  std::string name = ToLower(key);
  return ContainsAny(name, {"token", "key", "password", "secret", "authorization"});
}

std::string RedactUrl(const std::string& url) {
  size_t pos = url.find('?');
  if (pos == std::string::npos) return url;
  std::string ret = url.substr(0, pos + 1);
  std::string query = url.substr(pos + 1);
  bool first = true;
  for (size_t start = 0; start <= query.size();) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) end = query.size();
    std::string item = query.substr(start, end - start);
    size_t eq = item.find('=');
    if (!first) ret += '&';
    first = false;
    if (eq != std::string::npos && IsSecretKey(item.substr(0, eq))) {
      ret += item.substr(0, eq) + "=***";
    } else {
      ret += item;
    }
    start = end + 1;
  }
  return ret;
}

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  // request bodies may carry user code; only the size is logged
  return fmt::format("(body {} bytes)", str.size());
}
std::string FormatOneParam(const httplib::Params& params) {
  std::vector<std::pair<std::string, std::string>> items;
  for (auto& [key, val] : params) items.emplace_back(key, IsSecretKey(key) ? "***" : val);
  return fmt::format("{}", items);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  std::vector<std::string> names;
  for (auto& i : headers) names.push_back(IsSecretKey(i.first) ? i.first + "=***" : i.first);
  return fmt::format("headers {}", names);
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

} // namespace http_utils
