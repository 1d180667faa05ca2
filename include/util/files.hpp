#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ds::util {

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& path, const std::string& contents);

std::string generate_random_suffix(size_t length = 8);

// Resolves an executable by name against $PATH, the way execvp() would.
// Names containing a slash are checked as given.
std::optional<std::filesystem::path> findExecutable(const std::string& name);

// True when `path` resolves to `root` or somewhere beneath it
bool isWithin(const std::filesystem::path& root, const std::filesystem::path& path);

}
