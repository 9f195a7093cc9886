// =============================================================================
// tag-counter - Primer Context Implementation
// =============================================================================

#include "tagc/core/primer_context.h"

#include <fmt/format.h>

#include "tagc/common/error.h"
#include "tagc/core/sequence.h"

namespace tagc::core {

PrimerContext::PrimerContext(std::string_view fivePrimeContext, std::string_view threePrimeContext) {
    if (fivePrimeContext.size() < kAnchorLength) {
        throw ConfigError(fmt::format("five_p_seq (BA-primer) must be at least {}nt long, got '{}'",
                                      kAnchorLength, fivePrimeContext));
    }
    if (threePrimeContext.size() < kAnchorLength) {
        throw ConfigError(fmt::format("three_p_seq (R2-amp97) must be at least {}nt long, got '{}'",
                                      kAnchorLength, threePrimeContext));
    }

    fivePrimeAnchor_ = toLower(fivePrimeContext.substr(fivePrimeContext.size() - kAnchorLength));
    threePrimeAnchor_ = toLower(threePrimeContext.substr(0, kAnchorLength));
    fivePrimeAnchorRc_ = reverseComplement(fivePrimeAnchor_);
    threePrimeAnchorRc_ = reverseComplement(threePrimeAnchor_);
}

}  // namespace tagc::core
