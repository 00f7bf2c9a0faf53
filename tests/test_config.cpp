#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include "test_frames.hpp"

using namespace testing_frames;

static ErrorKind validationError(const PipelineConfig& cfg) {
    try {
        validateConfig(cfg);
    } catch (const PipelineError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "config was accepted";
    return ErrorKind::ModelFailure;
}

TEST(Config, DefaultsAreValid) {
    PipelineConfig cfg;
    EXPECT_NO_THROW(validateConfig(cfg));
    EXPECT_EQ(cfg.renderFactor, 21);
    EXPECT_DOUBLE_EQ(cfg.saturationScale, 0.8);
    EXPECT_DOUBLE_EQ(cfg.claheClipLimit, 0.5);
    EXPECT_DOUBLE_EQ(cfg.blendFactor, 0.6);
    EXPECT_EQ(cfg.tileGridSize, cv::Size(8, 8));
    EXPECT_EQ(cfg.matchReference, MatchReference::Processed);
}

TEST(Config, OutOfRangeValuesAreRejected) {
    PipelineConfig cfg;

    cfg = PipelineConfig();
    cfg.saturationScale = -0.5;
    EXPECT_EQ(validationError(cfg), ErrorKind::ConfigError);

    cfg = PipelineConfig();
    cfg.claheClipLimit = 0.0;
    EXPECT_EQ(validationError(cfg), ErrorKind::ConfigError);

    cfg = PipelineConfig();
    cfg.blendFactor = 1.5;
    EXPECT_EQ(validationError(cfg), ErrorKind::ConfigError);

    cfg = PipelineConfig();
    cfg.renderFactor = 0;
    EXPECT_EQ(validationError(cfg), ErrorKind::ConfigError);

    cfg = PipelineConfig();
    cfg.tileGridSize = cv::Size(0, 8);
    EXPECT_EQ(validationError(cfg), ErrorKind::ConfigError);

    cfg = PipelineConfig();
    cfg.codec = "h264x";
    EXPECT_EQ(validationError(cfg), ErrorKind::ConfigError);

    cfg = PipelineConfig();
    cfg.workers = 0;
    EXPECT_EQ(validationError(cfg), ErrorKind::ConfigError);
}

TEST(Config, BlendFactorBoundsAreInclusive) {
    PipelineConfig cfg;
    cfg.blendFactor = 0.0;
    EXPECT_NO_THROW(validateConfig(cfg));
    cfg.blendFactor = 1.0;
    EXPECT_NO_THROW(validateConfig(cfg));
}

TEST(Config, SaveThenLoadKeepsEveryField) {
    TempDir tmp("config");
    PipelineConfig cfg;
    cfg.renderFactor = 35;
    cfg.saturationScale = 0.65;
    cfg.claheClipLimit = 1.25;
    cfg.blendFactor = 0.4;
    cfg.tileGridSize = cv::Size(4, 6);
    cfg.matchReference = MatchReference::Raw;
    cfg.codec = "mp4v";
    cfg.workers = 3;

    ASSERT_TRUE(saveConfig(tmp.str("pipeline.yml"), cfg));

    PipelineConfig loaded;
    ASSERT_TRUE(loadConfig(tmp.str("pipeline.yml"), loaded));
    EXPECT_EQ(loaded.renderFactor, 35);
    EXPECT_DOUBLE_EQ(loaded.saturationScale, 0.65);
    EXPECT_DOUBLE_EQ(loaded.claheClipLimit, 1.25);
    EXPECT_DOUBLE_EQ(loaded.blendFactor, 0.4);
    EXPECT_EQ(loaded.tileGridSize, cv::Size(4, 6));
    EXPECT_EQ(loaded.matchReference, MatchReference::Raw);
    EXPECT_EQ(loaded.codec, "mp4v");
    EXPECT_EQ(loaded.workers, 3);
}

TEST(Config, MissingKeysKeepDefaults) {
    TempDir tmp("config");
    {
        cv::FileStorage fs(tmp.str("partial.yml"), cv::FileStorage::WRITE);
        fs << "blend_factor" << 0.9;
    }

    PipelineConfig cfg;
    ASSERT_TRUE(loadConfig(tmp.str("partial.yml"), cfg));
    EXPECT_DOUBLE_EQ(cfg.blendFactor, 0.9);
    EXPECT_DOUBLE_EQ(cfg.saturationScale, 0.8);
    EXPECT_EQ(cfg.renderFactor, 21);
    EXPECT_EQ(cfg.codec, "avc1");
}

TEST(Config, MissingFileIsReported) {
    PipelineConfig cfg;
    EXPECT_FALSE(loadConfig("/nonexistent/dir/pipeline.yml", cfg));
}

TEST(Config, UnknownMatchReferenceIsConfigError) {
    TempDir tmp("config");
    {
        cv::FileStorage fs(tmp.str("bad.yml"), cv::FileStorage::WRITE);
        fs << "match_reference" << "previous";
    }

    PipelineConfig cfg;
    try {
        loadConfig(tmp.str("bad.yml"), cfg);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
    }
}

TEST(Config, MatchReferenceNamesParseBack) {
    MatchReference ref = MatchReference::Processed;
    EXPECT_TRUE(parseMatchReference(matchReferenceName(MatchReference::Raw), ref));
    EXPECT_EQ(ref, MatchReference::Raw);
    EXPECT_TRUE(parseMatchReference(matchReferenceName(MatchReference::Processed), ref));
    EXPECT_EQ(ref, MatchReference::Processed);
    EXPECT_FALSE(parseMatchReference("Raw", ref));
}
