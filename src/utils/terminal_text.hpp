#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace compass::utils {

// Strict UTF-8 check: rejects truncated sequences, overlongs, surrogates and
// code points above U+10FFFF.
bool IsValidUtf8(const char* data, std::size_t size);

// Returns the chunk as text when it is complete UTF-8, std::nullopt otherwise.
// Chunks are decoded independently; nothing is carried over between calls.
std::optional<std::string> DecodeChunk(const char* data, std::size_t size);

std::string CleanAnsi(const std::string& text);

void AppendOutput(std::string& buffer, const std::string& chunk);

}  // namespace compass::utils
