#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <filesystem>

#include <sqljudge/utils.h>

namespace fs = std::filesystem;

int CloseFrom(int minfd);

// Retry on EINTR and short writes
bool WriteAll(int fd, const std::string& buf);

bool ReadFile(const fs::path&, std::string& out);

#endif  // UTILS_H_
