#include "blob_codec.hpp"

#include <bit>
#include <cstdint>
#include <stdexcept>

namespace omni::db::sql {

std::string EncodeFloatVector(const std::vector<float>& values) {
  std::string out;
  out.reserve(values.size() * 4);
  for (float v : values) {
    const auto bits = std::bit_cast<uint32_t>(v);
    out.push_back(static_cast<char>(bits & 0xFF));
    out.push_back(static_cast<char>((bits >> 8) & 0xFF));
    out.push_back(static_cast<char>((bits >> 16) & 0xFF));
    out.push_back(static_cast<char>((bits >> 24) & 0xFF));
  }
  return out;
}

std::vector<float> DecodeFloatVector(const void* data, std::size_t size_bytes) {
  if (size_bytes % 4 != 0) {
    throw std::runtime_error("embedding blob size is not a multiple of 4");
  }

  const auto*        bytes = static_cast<const unsigned char*>(data);
  std::vector<float> out(size_bytes / 4);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const unsigned char* p    = bytes + i * 4;
    const uint32_t       bits = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
                          (static_cast<uint32_t>(p[3]) << 24);
    out[i] = std::bit_cast<float>(bits);
  }
  return out;
}

} // namespace omni::db::sql
