#include "record_codec.hpp"

#include "kisancpp/errors.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace kisancpp::core::codec {
namespace {

inline constexpr std::array<std::byte, 6> kEmbeddingMagic = {
    std::byte{'K'},
    std::byte{'S'},
    std::byte{'E'},
    std::byte{'M'},
    std::byte{'B'},
    std::byte{'1'},
};

inline constexpr std::array<std::byte, 6> kMapMagic = {
    std::byte{'K'},
    std::byte{'S'},
    std::byte{'M'},
    std::byte{'A'},
    std::byte{'P'},
    std::byte{'1'},
};

void AppendU32LE(std::vector<std::byte>& out, std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendF32LE(std::vector<std::byte>& out, float value) {
  std::uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  AppendU32LE(out, bits);
}

void AppendString(std::vector<std::byte>& out, const std::string& value) {
  if (value.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
    throw ValidationError("record field exceeds uint32 length");
  }
  AppendU32LE(out, static_cast<std::uint32_t>(value.size()));
  for (const char ch : value) {
    out.push_back(static_cast<std::byte>(static_cast<unsigned char>(ch)));
  }
}

class Reader {
 public:
  explicit Reader(const std::vector<std::byte>& payload, std::size_t cursor) : payload_(payload), cursor_(cursor) {}

  std::optional<std::uint32_t> ReadU32() {
    if (cursor_ + 4 > payload_.size()) {
      return std::nullopt;
    }
    std::uint32_t out = 0;
    for (std::size_t i = 0; i < 4; ++i) {
      out |= static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(payload_[cursor_ + i])) << (8U * i);
    }
    cursor_ += 4;
    return out;
  }

  std::optional<float> ReadF32() {
    const auto bits = ReadU32();
    if (!bits.has_value()) {
      return std::nullopt;
    }
    float value = 0.0F;
    std::uint32_t raw = *bits;
    std::memcpy(&value, &raw, sizeof(value));
    return value;
  }

  std::optional<std::string> ReadString() {
    const auto length = ReadU32();
    if (!length.has_value() || cursor_ + *length > payload_.size()) {
      return std::nullopt;
    }
    std::string out{};
    out.reserve(*length);
    for (std::size_t i = 0; i < *length; ++i) {
      out.push_back(static_cast<char>(std::to_integer<std::uint8_t>(payload_[cursor_ + i])));
    }
    cursor_ += *length;
    return out;
  }

  [[nodiscard]] bool AtEnd() const { return cursor_ == payload_.size(); }

 private:
  const std::vector<std::byte>& payload_;
  std::size_t cursor_ = 0;
};

template <std::size_t N>
bool HasMagic(const std::vector<std::byte>& payload, const std::array<std::byte, N>& magic) {
  return payload.size() >= magic.size() && std::equal(magic.begin(), magic.end(), payload.begin());
}

}  // namespace

std::vector<std::byte> EncodeEmbedding(const std::vector<float>& embedding) {
  if (embedding.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
    throw ValidationError("embedding length exceeds uint32");
  }
  std::vector<std::byte> out{};
  out.reserve(kEmbeddingMagic.size() + 4 + embedding.size() * sizeof(float));
  out.insert(out.end(), kEmbeddingMagic.begin(), kEmbeddingMagic.end());
  AppendU32LE(out, static_cast<std::uint32_t>(embedding.size()));
  for (const float value : embedding) {
    AppendF32LE(out, value);
  }
  return out;
}

std::optional<std::vector<float>> DecodeEmbedding(const std::vector<std::byte>& payload) {
  if (!HasMagic(payload, kEmbeddingMagic)) {
    return std::nullopt;
  }
  Reader reader(payload, kEmbeddingMagic.size());
  const auto count = reader.ReadU32();
  if (!count.has_value()) {
    return std::nullopt;
  }
  std::vector<float> embedding{};
  embedding.reserve(*count);
  for (std::uint32_t i = 0; i < *count; ++i) {
    const auto value = reader.ReadF32();
    if (!value.has_value()) {
      return std::nullopt;
    }
    embedding.push_back(*value);
  }
  if (!reader.AtEnd()) {
    return std::nullopt;
  }
  return embedding;
}

std::vector<std::byte> EncodeMap(const Metadata& map) {
  if (map.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
    throw ValidationError("record map count exceeds uint32");
  }
  std::vector<std::pair<std::string, std::string>> sorted(map.begin(), map.end());
  std::sort(sorted.begin(), sorted.end());

  std::vector<std::byte> out{};
  out.reserve(kMapMagic.size() + 4 + sorted.size() * 16);
  out.insert(out.end(), kMapMagic.begin(), kMapMagic.end());
  AppendU32LE(out, static_cast<std::uint32_t>(sorted.size()));
  for (const auto& [key, value] : sorted) {
    AppendString(out, key);
    AppendString(out, value);
  }
  return out;
}

std::optional<Metadata> DecodeMap(const std::vector<std::byte>& payload) {
  if (!HasMagic(payload, kMapMagic)) {
    return std::nullopt;
  }
  Reader reader(payload, kMapMagic.size());
  const auto count = reader.ReadU32();
  if (!count.has_value()) {
    return std::nullopt;
  }
  Metadata map{};
  for (std::uint32_t i = 0; i < *count; ++i) {
    const auto key = reader.ReadString();
    const auto value = reader.ReadString();
    if (!key.has_value() || !value.has_value()) {
      return std::nullopt;
    }
    map[*key] = *value;
  }
  if (!reader.AtEnd()) {
    return std::nullopt;
  }
  return map;
}

}  // namespace kisancpp::core::codec
