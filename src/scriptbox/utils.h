#ifndef SCRIPTBOX_UTILS_H_
#define SCRIPTBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <scriptbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

int CloseFrom(int minfd);
bool SetNonblock(int fd);

// loop until all bytes are written / read; ReadAll returns false on EOF before len bytes
bool WriteAll(int fd, const void* buf, size_t len);
bool ReadAll(int fd, void* buf, size_t len);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);

// cut at a UTF-8 boundary so previews never end with half a character
std::string Utf8Prefix(const std::string& str, size_t max_bytes);
std::string Utf8Suffix(const std::string& str, size_t max_bytes);

#endif  // SCRIPTBOX_UTILS_H_
