// =============================================================================
// tag-counter - Primer Context
// =============================================================================
// Short flanking anchors derived once from the full 5' and 3' context
// sequences surrounding the barcode in the amplicon.
// =============================================================================

#ifndef TAGC_CORE_PRIMER_CONTEXT_H
#define TAGC_CORE_PRIMER_CONTEXT_H

#include <string>
#include <string_view>

#include "tagc/common/types.h"

namespace tagc::core {

/// @brief Forward and reverse-complement anchors around the barcode.
///
/// The anchors are always kAnchorLength bases: the end of the 5' context and
/// the start of the 3' context, in the orientation of the barcode table. All
/// anchors are stored lowercase.
class PrimerContext {
public:
    /// @brief Derive anchors from full context sequences.
    /// @throws ConfigError if either context is shorter than kAnchorLength.
    PrimerContext(std::string_view fivePrimeContext, std::string_view threePrimeContext);

    /// @brief Anchors for the default BA primer / R2-to-amp97 amplicon.
    [[nodiscard]] static PrimerContext defaults() {
        return PrimerContext(kDefaultFivePrimeContext, kDefaultThreePrimeContext);
    }

    /// @brief Last bases of the 5' context.
    [[nodiscard]] const std::string& fivePrimeAnchor() const noexcept { return fivePrimeAnchor_; }

    /// @brief First bases of the 3' context.
    [[nodiscard]] const std::string& threePrimeAnchor() const noexcept { return threePrimeAnchor_; }

    [[nodiscard]] const std::string& fivePrimeAnchorRc() const noexcept { return fivePrimeAnchorRc_; }
    [[nodiscard]] const std::string& threePrimeAnchorRc() const noexcept { return threePrimeAnchorRc_; }

private:
    std::string fivePrimeAnchor_;
    std::string threePrimeAnchor_;
    std::string fivePrimeAnchorRc_;
    std::string threePrimeAnchorRc_;
};

}  // namespace tagc::core

#endif  // TAGC_CORE_PRIMER_CONTEXT_H
