#include <gtest/gtest.h>
#include "pageflow/settings.h"
#include "pageflow/errors.h"

using namespace pageflow;

TEST(SettingsTest, DensityChunkSizes) {
    EXPECT_EQ(chunkSizeForDensity(Density::Less), 300);
    EXPECT_EQ(chunkSizeForDensity(Density::Medium), 500);
    EXPECT_EQ(chunkSizeForDensity(Density::More), 800);
    EXPECT_EQ(kBulkLoadChunkSize, 400);
}

TEST(SettingsTest, DensityNamesParseBack) {
    for (Density density : {Density::Less, Density::Medium, Density::More}) {
        EXPECT_EQ(parseDensity(densityName(density)), density);
    }
}

TEST(SettingsTest, UnknownDensityThrows) {
    for (const char* key : {"", "Medium", "largest", " less"}) {
        try {
            parseDensity(key);
            FAIL() << "expected InvalidDensity for '" << key << "'";
        } catch (const PageflowError& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidDensity);
        }
    }
}

TEST(SettingsTest, Defaults) {
    ReaderSettings settings;
    EXPECT_EQ(settings.density, Density::Medium);
    EXPECT_FALSE(settings.bulkLoad);
    EXPECT_EQ(settings.classifier.navigationLinkThreshold, 10);
    EXPECT_EQ(settings.reflow.snippetMinLength, 50);
    EXPECT_EQ(settings.reflow.snippetMaxLength, 200);
    EXPECT_FLOAT_EQ(settings.pagination.swipeThreshold, 40.0f);
    EXPECT_FLOAT_EQ(settings.pagination.transitionDurationMs, 300.0f);
}

TEST(SettingsTest, ErrorCodeNames) {
    EXPECT_STREQ(errorCodeName(ErrorCode::NoExtractableContent), "NoExtractableContent");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidDensity), "InvalidDensity");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidChunkSize), "InvalidChunkSize");
    EXPECT_STREQ(errorCodeName(ErrorCode::MalformedMarkup), "MalformedMarkup");
}
