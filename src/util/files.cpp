#include "util/files.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

std::string ds::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void ds::util::writeFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
    out.write(contents.data(), static_cast<long>(contents.size()));
    out.close();
}

std::string ds::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

static bool isExecutableFile(const fs::path& candidate) {
    struct stat st{};
    if (::stat(candidate.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(candidate.c_str(), X_OK) == 0;
}

std::optional<fs::path> ds::util::findExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) return fs::path(name);
        return std::nullopt;
    }

    const char* envPath = std::getenv("PATH");
    if (!envPath || !*envPath) return std::nullopt;

    std::istringstream dirs(envPath);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        // empty PATH element means the current directory
        const fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        if (isExecutableFile(candidate)) return candidate;
    }

    return std::nullopt;
}

bool ds::util::isWithin(const fs::path& root, const fs::path& path) {
    const auto rel = fs::weakly_canonical(path).lexically_relative(fs::weakly_canonical(root));
    return !rel.empty() && *rel.begin() != "..";
}
