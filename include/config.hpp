#pragma once
#include <opencv2/opencv.hpp>
#include <string>

// Which frame the histogram matcher compares frame N+1 against.
enum class MatchReference {
    Processed,   // final output of frame N
    Raw          // unmodified colorized frame N
};

struct PipelineConfig {
    int renderFactor = 21;
    double saturationScale = 0.8;
    double claheClipLimit = 0.5;
    double blendFactor = 0.6;
    cv::Size tileGridSize{8, 8};
    MatchReference matchReference = MatchReference::Processed;

    std::string codec = "avc1";   // FourCC for both output streams
    int workers = 1;              // videos processed concurrently
};

bool saveConfig(const std::string& path, const PipelineConfig& cfg);

// Missing keys keep the values already in cfg.
bool loadConfig(const std::string& path, PipelineConfig& cfg);

// Throws PipelineError(ConfigError) describing the first bad parameter.
void validateConfig(const PipelineConfig& cfg);

const char* matchReferenceName(MatchReference ref);
bool parseMatchReference(const std::string& text, MatchReference& ref);

int codecFourcc(const std::string& codec);
