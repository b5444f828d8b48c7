#include "kisancpp/embeddings.hpp"
#include "kisancpp/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

namespace kisancpp {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr std::uint64_t kTermSeed = 0;
constexpr std::uint64_t kPairSeed = 0x9E3779B97F4A7C15ULL;
constexpr float kPairWeight = 0.5F;

// Glue words that carry no agronomic meaning in advisory text.
constexpr std::array<std::string_view, 14> kStopWords = {
    "a", "an", "and", "are", "at", "by", "for", "in", "is", "of", "on", "the", "to", "with",
};

bool IsStopWord(std::string_view term) {
  return std::find(kStopWords.begin(), kStopWords.end(), term) != kStopWords.end();
}

// "pests" and "pest" share a slot; short words and "-ss" endings stay as-is.
void FoldPlural(std::string& term) {
  if (term.size() > 4 && term.back() == 's' && term[term.size() - 2] != 's') {
    term.pop_back();
  }
}

// Lower-cased alphanumeric runs, stop words dropped, plurals folded.
std::vector<std::string> ExtractTerms(std::string_view text) {
  std::vector<std::string> terms{};
  std::string current{};
  const auto flush = [&] {
    if (current.empty()) {
      return;
    }
    if (!IsStopWord(current)) {
      FoldPlural(current);
      terms.push_back(current);
    }
    current.clear();
  };
  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
    } else {
      flush();
    }
  }
  flush();
  return terms;
}

struct FeatureSlot {
  std::size_t index = 0;
  float sign = 1.0F;
};

// Seeded FNV-1a; the top bit picks the sign so collisions tend to cancel.
FeatureSlot SlotFor(std::string_view feature, std::uint64_t seed, int dimensions) {
  std::uint64_t hash = kFnvOffset ^ seed;
  for (const unsigned char ch : feature) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return FeatureSlot{static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions)),
                     (hash >> 63U) != 0U ? -1.0F : 1.0F};
}

void ScaleToUnitLength(std::vector<float>& embedding) {
  const double squared = std::inner_product(embedding.begin(), embedding.end(), embedding.begin(), 0.0,
                                            std::plus<>(), [](float lhs, float rhs) {
                                              return static_cast<double>(lhs) * static_cast<double>(rhs);
                                            });
  if (squared <= 0.0) {
    return;
  }
  const double scale = 1.0 / std::sqrt(squared);
  for (auto& value : embedding) {
    value = static_cast<float>(static_cast<double>(value) * scale);
  }
}

}  // namespace

HashingEmbedder::HashingEmbedder(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw ValidationError("HashingEmbedder dimensions must be positive");
  }
}

int HashingEmbedder::dimensions() const {
  return dimensions_;
}

bool HashingEmbedder::normalize() const {
  return true;
}

std::optional<EmbeddingIdentity> HashingEmbedder::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("kisancpp"),
      .model = std::string("feature-hashing"),
      .dimensions = dimensions_,
      .normalized = true,
  };
}

std::vector<float> HashingEmbedder::Embed(const std::string& text) {
  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = memoized_embeddings_.find(text);
    if (cached != memoized_embeddings_.end()) {
      return cached->second;
    }
  }

  std::vector<float> embedding(static_cast<std::size_t>(dimensions_), 0.0F);

  // Each term plus each adjacent pair of terms, so word order contributes.
  const auto terms = ExtractTerms(text);
  for (std::size_t i = 0; i < terms.size(); ++i) {
    const auto term = SlotFor(terms[i], kTermSeed, dimensions_);
    embedding[term.index] += term.sign;
    if (i + 1 < terms.size()) {
      const auto pair = SlotFor(terms[i] + "_" + terms[i + 1], kPairSeed, dimensions_);
      embedding[pair.index] += kPairWeight * pair.sign;
    }
  }

  if (normalize()) {
    ScaleToUnitLength(embedding);
  }

  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memoized_embeddings_.find(text) == memoized_embeddings_.end()) {
      while (memoized_embeddings_.size() >= memoization_capacity_ && !memoization_order_.empty()) {
        memoized_embeddings_.erase(memoization_order_.front());
        memoization_order_.pop_front();
      }
      memoization_order_.push_back(text);
      memoized_embeddings_[text] = embedding;
    }
  }

  return embedding;
}

std::vector<std::vector<float>> HashingEmbedder::EmbedBatch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Embed(text));
  }
  return out;
}

std::size_t HashingEmbedder::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memoized_embeddings_.size();
}

}  // namespace kisancpp
