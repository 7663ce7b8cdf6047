#ifndef INCLUDE_JUDGEBOX_UTILS_H_
#define INCLUDE_JUDGEBOX_UTILS_H_

#include <string>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

std::string Trim(const std::string&);
std::string ToLower(std::string);
bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles);

// Longest prefix of str with at most max_bytes bytes that does not split a UTF-8 sequence
std::string Utf8Prefix(const std::string& str, size_t max_bytes);

// UNIX timestamp, milliseconds
int64_t NowMs();
// monotonic
int64_t MonotonicMs();

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
// never throws; failures (e.g. a file still held open) are only logged
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);

#endif  // INCLUDE_JUDGEBOX_UTILS_H_
