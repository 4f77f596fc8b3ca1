#pragma once

#include <string>
#include <vector>

#include "core/answer.hpp"

namespace verirag {

struct ValidatorOptions {
    // Reject the whole answer when any marker points outside the passage list.
    bool strict = false;
};

struct ValidationResult {
    std::string clean_text;
    std::vector<std::string> used_documents;
    // 1-based passage indexes in order of first appearance in clean_text.
    std::vector<int> cited_passages;
    double confidence = 0.0;
    bool ok = false;
    int claims = 0;
    int supported_claims = 0;
    int invalid_markers = 0;
};

// Checks generated text against the exact passage list it was generated from.
//
// Text is split into lines and lines into sentences; a sentence ends at '.',
// '!' or '?' together with any markers trailing it. Short headings and
// lead-ins ending with ':' (five words at most) and sentences without a letter
// or digit are structure, not claims; longer ones are judged as prose. A
// fenced block with content is a single claim, kept only when it carries a
// valid marker. A claim with markers is judged by its own markers; a claim
// without markers takes the markers of the next marker-bearing sentence on the
// same line. Invalid markers are removed and unsupported claims are dropped.
//
// Running validate() again on clean_text with the same passages returns the
// same clean_text, used_documents and cited_passages. Confidence is only a
// fixed point from the second run on: the first run's claim coverage counts
// the claims it dropped, the clean text has full coverage.
class CitationValidator {
public:
    explicit CitationValidator(ValidatorOptions options = {});

    ValidationResult validate(const std::string& raw_text, const std::vector<RetrievedPassage>& passages) const;

private:
    ValidatorOptions options_;
};

}  // namespace verirag
