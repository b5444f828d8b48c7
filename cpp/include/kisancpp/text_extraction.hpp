#pragma once

#include <string>
#include <vector>

namespace kisancpp::text {

// Section extractors for unstructured scheme and pest documents. Each section
// runs from its header to the next known header or the end of the text.

std::string ExtractSchemeName(const std::string& text);
std::string ExtractSchemeDescription(const std::string& text);
std::string ExtractSchemeEligibility(const std::string& text);
std::string ExtractSchemeBenefits(const std::string& text);
std::string ExtractSchemeApplication(const std::string& text);

// Sentences of the section, each ending in '.'; fragments of 10 characters or
// fewer are dropped. Empty when the section is absent.
std::vector<std::string> ExtractManagementMethods(const std::string& text);
std::vector<std::string> ExtractOrganicSolutions(const std::string& text);
std::vector<std::string> ExtractChemicalSolutions(const std::string& text);
std::vector<std::string> ExtractPreventiveMeasures(const std::string& text);

std::vector<std::string> SplitSentences(const std::string& section);

}  // namespace kisancpp::text
