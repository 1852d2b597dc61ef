// =============================================================================
// Error Hierarchy Tests
// =============================================================================

#include <gtest/gtest.h>
#include <string>
#include "engram/error.hpp"

using namespace engram;

namespace {

void require_positive(int value) {
    ENGRAM_CHECK_ARGUMENT(value > 0, "value must be positive");
}

} // namespace

TEST(ErrorTest, EachErrorCarriesItsCode) {
    EXPECT_EQ(InvalidArgumentError("x").code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(BackendUnavailableError("x").code(), ErrorCode::BACKEND_UNAVAILABLE);
    EXPECT_EQ(CollectionNotFoundError("c").code(), ErrorCode::COLLECTION_NOT_FOUND);
    EXPECT_EQ(OperationCancelledError().code(), ErrorCode::OPERATION_CANCELLED);
    EXPECT_EQ(ConfigError("x").code(), ErrorCode::CONFIG_INVALID);
}

TEST(ErrorTest, MessageIncludesContextAndSuggestion) {
    BackendUnavailableError error("Qdrant unreachable", "scroll", "Check the host");
    std::string what = error.what();

    EXPECT_NE(what.find("[100]"), std::string::npos);
    EXPECT_NE(what.find("Qdrant unreachable"), std::string::npos);
    EXPECT_NE(what.find("Context: scroll"), std::string::npos);
    EXPECT_NE(what.find("Suggestion: Check the host"), std::string::npos);
}

TEST(ErrorTest, CheckArgumentReportsCallingFunction) {
    EXPECT_NO_THROW(require_positive(1));
    try {
        require_positive(0);
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_EQ(e.context(), "require_positive");
    }
}
