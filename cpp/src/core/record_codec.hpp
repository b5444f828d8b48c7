#pragma once

#include "kisancpp/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace kisancpp::core::codec {

// Little-endian float32 payload prefixed with "KSEMB1" and a u32 count.
[[nodiscard]] std::vector<std::byte> EncodeEmbedding(const std::vector<float>& embedding);
[[nodiscard]] std::optional<std::vector<float>> DecodeEmbedding(const std::vector<std::byte>& payload);

// "KSMAP1", u32 entry count, then length-prefixed key/value pairs sorted by key.
[[nodiscard]] std::vector<std::byte> EncodeMap(const Metadata& map);
[[nodiscard]] std::optional<Metadata> DecodeMap(const std::vector<std::byte>& payload);

}  // namespace kisancpp::core::codec
