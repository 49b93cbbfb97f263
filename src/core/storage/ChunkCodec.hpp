#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pkgstore {

// Splits payloads into fixed-size slices and joins them back. Stateless.
namespace chunk_codec {

// Slices view into payload; payload must outlive the result.
// Every slice is chunkSize bytes except the last, which is (0, chunkSize].
// Throws InvalidInput if chunkSize <= 0.
std::vector<std::string_view> split(std::string_view payload, int64_t chunkSize);

// Concatenation in the given order.
std::string join(const std::vector<std::string>& chunks);
std::string join(const std::vector<std::string_view>& chunks);

// Number of slices split() produces for a payload of the given length.
int64_t chunkCount(int64_t length, int64_t chunkSize);

} // namespace chunk_codec
} // namespace pkgstore
