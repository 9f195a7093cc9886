// =============================================================================
// tag-counter - Test Entry Point
// =============================================================================
// Library code logs through the global quill logger, so it is initialized
// once before any test runs.
// =============================================================================

#include <gtest/gtest.h>

#include "tagc/common/logger.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    tagc::log::init("", tagc::log::Level::kError);

    const int rc = RUN_ALL_TESTS();

    tagc::log::shutdown();
    return rc;
}
