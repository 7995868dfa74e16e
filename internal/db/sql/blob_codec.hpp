#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace omni::db::sql {

/*
  Embedding vectors are stored as packed little-endian float32.
*/

std::string EncodeFloatVector(const std::vector<float>& values);

std::vector<float> DecodeFloatVector(const void* data, std::size_t size_bytes);

} // namespace omni::db::sql
