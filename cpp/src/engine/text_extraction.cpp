#include "kisancpp/text_extraction.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace kisancpp::text {
namespace {

// A header is a run of words separated by any whitespace, e.g. "organic solutions".
using HeaderWords = std::vector<std::string_view>;

struct SectionRule {
  std::vector<HeaderWords> headers;
  std::vector<std::string_view> terminators;
};

const SectionRule& DescriptionRule() {
  static const SectionRule rule{{{"description"}},
                                {"eligibility:", "benefits:", "how to apply:", "deadlines:", "states:"}};
  return rule;
}

const SectionRule& EligibilityRule() {
  static const SectionRule rule{{{"eligibility"}}, {"benefits:", "how to apply:", "deadlines:", "states:"}};
  return rule;
}

const SectionRule& BenefitsRule() {
  static const SectionRule rule{{{"benefits"}}, {"eligibility:", "how to apply:", "deadlines:", "states:"}};
  return rule;
}

const SectionRule& ApplicationRule() {
  static const SectionRule rule{{{"how", "to", "apply"}}, {"eligibility:", "benefits:", "deadlines:", "states:"}};
  return rule;
}

const SectionRule& ManagementRule() {
  static const SectionRule rule{{{"management"}}, {"prevention:", "organic solutions:", "chemical control:"}};
  return rule;
}

const SectionRule& OrganicRule() {
  static const SectionRule rule{{{"organic", "control"}, {"organic", "solutions"}, {"organic", "management"}},
                                {"chemical", "prevention:"}};
  return rule;
}

const SectionRule& ChemicalRule() {
  static const SectionRule rule{{{"chemical", "control"}, {"chemical", "solutions"}, {"chemical", "management"}},
                                {"organic", "prevention:"}};
  return rule;
}

const SectionRule& PreventionRule() {
  static const SectionRule rule{{{"prevention"}, {"preventive", "measures"}}, {"chemical", "organic"}};
  return rule;
}

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string Trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && IsSpace(value[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(value[end - 1])) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}

std::string Lowered(const std::string& text) {
  std::string lowered(text.size(), '\0');
  std::transform(text.begin(), text.end(), lowered.begin(),
                 [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return lowered;
}

// End offset of `words` matched at `pos`, or npos.
std::size_t MatchWordsAt(std::string_view text, std::size_t pos, const HeaderWords& words) {
  bool first = true;
  for (const auto word : words) {
    if (!first) {
      const auto gap = pos;
      while (pos < text.size() && IsSpace(text[pos])) {
        ++pos;
      }
      if (pos == gap) {
        return std::string_view::npos;
      }
    }
    first = false;
    if (text.substr(pos, word.size()) != word) {
      return std::string_view::npos;
    }
    pos += word.size();
  }
  return pos;
}

// Leftmost header occurrence as [begin, end), or nullopt.
std::optional<std::pair<std::size_t, std::size_t>> FindHeader(std::string_view text,
                                                              const std::vector<HeaderWords>& headers) {
  std::optional<std::pair<std::size_t, std::size_t>> best{};
  for (const auto& words : headers) {
    const auto lead = words.front();
    auto pos = text.find(lead);
    while (pos != std::string_view::npos && (!best.has_value() || pos < best->first)) {
      const auto end = MatchWordsAt(text, pos, words);
      if (end != std::string_view::npos) {
        best = std::make_pair(pos, end);
        break;
      }
      pos = text.find(lead, pos + 1);
    }
  }
  return best;
}

// Header, optional ':', then everything up to the nearest terminator or the end.
std::optional<std::string> MatchSection(const std::string& text, const SectionRule& rule) {
  const auto lowered = Lowered(text);
  const std::string_view view(lowered);
  const auto header = FindHeader(view, rule.headers);
  if (!header.has_value()) {
    return std::nullopt;
  }
  auto body = header->second;
  if (body < view.size() && view[body] == ':') {
    ++body;
  }
  auto end = view.size();
  for (const auto terminator : rule.terminators) {
    const auto found = view.find(terminator, body);
    if (found != std::string_view::npos) {
      end = std::min(end, found);
    }
  }
  return Trim(std::string_view(text).substr(body, end - body));
}

std::vector<std::string> SentencesOf(const std::string& text, const SectionRule& rule) {
  const auto section = MatchSection(text, rule);
  if (!section.has_value()) {
    return {};
  }
  return SplitSentences(*section);
}

}  // namespace

std::string ExtractSchemeName(const std::string& text) {
  const auto newline = text.find('\n');
  auto name = Trim(std::string_view(text).substr(0, newline));
  return name.empty() ? std::string("Unknown Scheme") : name;
}

std::string ExtractSchemeDescription(const std::string& text) {
  return MatchSection(text, DescriptionRule()).value_or("No description available");
}

std::string ExtractSchemeEligibility(const std::string& text) {
  return MatchSection(text, EligibilityRule()).value_or("No eligibility information available");
}

std::string ExtractSchemeBenefits(const std::string& text) {
  return MatchSection(text, BenefitsRule()).value_or("No benefits information available");
}

std::string ExtractSchemeApplication(const std::string& text) {
  return MatchSection(text, ApplicationRule()).value_or("No application information available");
}

std::vector<std::string> ExtractManagementMethods(const std::string& text) {
  return SentencesOf(text, ManagementRule());
}

std::vector<std::string> ExtractOrganicSolutions(const std::string& text) {
  return SentencesOf(text, OrganicRule());
}

std::vector<std::string> ExtractChemicalSolutions(const std::string& text) {
  return SentencesOf(text, ChemicalRule());
}

std::vector<std::string> ExtractPreventiveMeasures(const std::string& text) {
  return SentencesOf(text, PreventionRule());
}

std::vector<std::string> SplitSentences(const std::string& section) {
  std::vector<std::string> sentences{};
  const auto keep = [&sentences](std::string_view fragment) {
    auto sentence = Trim(fragment);
    if (sentence.size() <= 10) {
      return;
    }
    if (sentence.back() != '.') {
      sentence.push_back('.');
    }
    sentences.push_back(std::move(sentence));
  };

  // A sentence ends at '.' followed by whitespace.
  const std::string_view view(section);
  std::size_t start = 0;
  for (std::size_t i = 0; i < view.size(); ++i) {
    if (view[i] != '.' || i + 1 >= view.size() || !IsSpace(view[i + 1])) {
      continue;
    }
    keep(view.substr(start, i - start));
    std::size_t next = i + 1;
    while (next < view.size() && IsSpace(view[next])) {
      ++next;
    }
    start = next;
    i = next - 1;
  }
  keep(view.substr(start));
  return sentences;
}

}  // namespace kisancpp::text
