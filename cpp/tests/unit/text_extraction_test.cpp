#include "kisancpp/text_extraction.hpp"

#include "../test_logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

using Sentences = std::vector<std::string>;

const char* kSchemeText =
    "PM-KISAN Samman Nidhi\n\n"
    "Description: Income support of Rs 6000 per year to landholding farmer families.\n\n"
    "Eligibility: All landholding farmer families with cultivable land.\n\n"
    "Benefits: Three equal installments paid directly into bank accounts.\n\n"
    "How to Apply: Register on the PM-KISAN portal or through a Common Service Centre.\n\n"
    "Deadlines: Rolling enrolment.\n\n"
    "States: All states";

const char* kPestText =
    "Stem borer in rice\n"
    "Management: Install pheromone traps for monitoring. Release Trichogramma egg parasitoids weekly. Do it.\n"
    "Organic solutions: Spray neem seed kernel extract at five percent.\n"
    "Chemical control: Apply chlorantraniliprole granules at the label dose.\n"
    "Prevention: Remove and destroy stubble after harvest. Avoid excess nitrogen fertilizer.";

void ScenarioSchemeSections() {
  kisancpp::tests::Log("scenario: scheme sections");
  using namespace kisancpp::text;
  Require(ExtractSchemeName(kSchemeText) == "PM-KISAN Samman Nidhi", "scheme name mismatch");
  Require(ExtractSchemeDescription(kSchemeText) ==
              "Income support of Rs 6000 per year to landholding farmer families.",
          "scheme description mismatch");
  Require(ExtractSchemeEligibility(kSchemeText) == "All landholding farmer families with cultivable land.",
          "scheme eligibility mismatch");
  Require(ExtractSchemeBenefits(kSchemeText) == "Three equal installments paid directly into bank accounts.",
          "scheme benefits mismatch");
  Require(ExtractSchemeApplication(kSchemeText) ==
              "Register on the PM-KISAN portal or through a Common Service Centre.",
          "scheme application mismatch");
}

void ScenarioSchemeFallbacks() {
  kisancpp::tests::Log("scenario: scheme fallbacks");
  using namespace kisancpp::text;
  const std::string bare = "Soil Health Card\nCards issued every two years";
  Require(ExtractSchemeName(bare) == "Soil Health Card", "first line should be the name");
  Require(ExtractSchemeDescription(bare) == "No description available", "description fallback mismatch");
  Require(ExtractSchemeEligibility(bare) == "No eligibility information available", "eligibility fallback mismatch");
  Require(ExtractSchemeBenefits(bare) == "No benefits information available", "benefits fallback mismatch");
  Require(ExtractSchemeApplication(bare) == "No application information available", "application fallback mismatch");
  Require(ExtractSchemeName("   \nbody") == "Unknown Scheme", "blank first line should fall back");

  const std::string no_deadline = "KCC\n\nHow to Apply: Visit your bank branch.\n\nStates: Maharashtra";
  Require(ExtractSchemeApplication(no_deadline) == "Visit your bank branch.", "states header must end a section");
}

void ScenarioPestSections() {
  kisancpp::tests::Log("scenario: pest sections");
  using namespace kisancpp::text;
  Require(ExtractManagementMethods(kPestText) ==
              Sentences({"Install pheromone traps for monitoring.", "Release Trichogramma egg parasitoids weekly."}),
          "management sentences mismatch");
  Require(ExtractOrganicSolutions(kPestText) == Sentences({"Spray neem seed kernel extract at five percent."}),
          "organic sentences mismatch");
  Require(ExtractChemicalSolutions(kPestText) ==
              Sentences({"Apply chlorantraniliprole granules at the label dose."}),
          "chemical sentences mismatch");
  Require(ExtractPreventiveMeasures(kPestText) ==
              Sentences({"Remove and destroy stubble after harvest.", "Avoid excess nitrogen fertilizer."}),
          "preventive sentences mismatch");

  const std::string plain = "Aphids suck sap from young leaves.";
  Require(ExtractManagementMethods(plain).empty(), "absent management section yields nothing");
  Require(ExtractOrganicSolutions(plain).empty(), "absent organic section yields nothing");
  Require(ExtractChemicalSolutions(plain).empty(), "absent chemical section yields nothing");
  Require(ExtractPreventiveMeasures(plain).empty(), "absent preventive section yields nothing");
}

void ScenarioSplitSentences() {
  kisancpp::tests::Log("scenario: split sentences");
  using kisancpp::text::SplitSentences;
  Require(SplitSentences("Short. Rotate crops every season.  Use clean seed material") ==
              Sentences({"Rotate crops every season.", "Use clean seed material."}),
          "split mismatch");
  Require(SplitSentences("").empty(), "empty section yields nothing");
  Require(SplitSentences("Exactly10!").empty(), "fragments of ten characters are dropped");
}

void ScenarioLargeDocuments() {
  kisancpp::tests::Log("scenario: large documents");
  using namespace kisancpp::text;
  const std::string clause = "small farmers with land holding ";
  std::string eligibility{};
  while (eligibility.size() < 128 * 1024) {
    eligibility += clause;
  }
  const std::string scheme = "Scheme\nEligibility: " + eligibility + "\n\nBenefits: Cash transfer to bank accounts.";
  kisancpp::tests::LogKV("scheme_bytes", static_cast<std::uint64_t>(scheme.size()));
  const auto extracted = ExtractSchemeEligibility(scheme);
  Require(extracted.size() == eligibility.size() - 1, "large eligibility section must survive intact");
  Require(extracted.compare(0, clause.size() - 1, clause, 0, clause.size() - 1) == 0, "eligibility text mismatch");
  Require(ExtractSchemeBenefits(scheme) == "Cash transfer to bank accounts.", "section after a large one mismatch");
  Require(ExtractSchemeApplication(scheme) == "No application information available", "absent section fallback");

  std::string methods = "Management: ";
  for (int i = 0; i < 4000; ++i) {
    methods += "Use light traps to monitor moths. ";
  }
  const auto sentences = ExtractManagementMethods(methods);
  Require(sentences.size() == 4000, "every sentence of a large section must be kept");
  Require(sentences.back() == "Use light traps to monitor moths.", "last sentence mismatch");
}

}  // namespace

int main() {
  try {
    kisancpp::tests::Log("text_extraction_test: start");
    ScenarioSchemeSections();
    ScenarioSchemeFallbacks();
    ScenarioPestSections();
    ScenarioSplitSentences();
    ScenarioLargeDocuments();
    kisancpp::tests::Log("text_extraction_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    kisancpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
