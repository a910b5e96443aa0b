#include "languages/artifact.hpp"

#include <fstream>
#include <random>
#include <system_error>

namespace compass::languages {

std::string GenerateArtifactId() {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(32);
    for (int i = 0; i < 32; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

std::filesystem::path UniqueArtifactPath(const std::filesystem::path& temp_dir,
                                         const std::string& prefix,
                                         const std::string& extension) {
    return temp_dir / (prefix + "_" + GenerateArtifactId() + "." + extension);
}

void WriteArtifact(const std::filesystem::path& path,
                   const std::string& content,
                   const std::string& what) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw PrepareError("Failed to write " + what + " to " + path.string());
    }
    output << content;
    output.flush();
    if (!output) {
        throw PrepareError("Failed to write " + what + " to " + path.string());
    }
}

void RemoveArtifact(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

}  // namespace compass::languages
