#include "judgebox/utils.h"

#include <chrono>
#include <cstring>
#include <fstream>
#include <cctype>
#include <algorithm>

#include <spdlog/spdlog.h>

std::string Trim(const std::string& str) {
  const char* kSpace = " \t\n\r\f\v";
  size_t l = str.find_first_not_of(kSpace);
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(kSpace);
  return str.substr(l, r - l + 1);
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
  for (const char* i : needles) {
    if (haystack.find(i) != std::string::npos) return true;
  }
  return false;
}

std::string Utf8Prefix(const std::string& str, size_t max_bytes) {
  if (str.size() <= max_bytes) return str;
  size_t len = max_bytes;
  // back off continuation bytes, then drop the lead byte if its sequence does not fit
  while (len > 0 && ((unsigned char)str[len] & 0xC0) == 0x80) len--;
  return str.substr(0, len);
}

int64_t NowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int64_t MonotonicMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  if (fout) fout.write(content.data(), content.size());
  if (!fout) {
    spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}
