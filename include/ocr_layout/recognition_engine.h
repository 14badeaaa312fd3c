#pragma once

#include "ocr_layout/types.h"
#include <map>
#include <string>
#include <vector>

namespace ocr_layout {

// Seam to the external recognition engine. One synchronous call per
// image; failures are reported by throwing (RecognitionError or
// MalformedTokenError). Implementations used with
// OcrExtractor::extract_batch must tolerate concurrent calls.
class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    // Tokens in raster order for the image
    virtual std::vector<Token> recognize(const std::string& image,
                                         const std::string& language,
                                         const std::string& engine_flags) = 0;

    virtual std::vector<std::string> available_languages() { return {"eng"}; }
};

// Named recognition presets and the engine flags behind them
class RecognitionProfiles {
public:
    static const std::map<std::string, std::string>& all();

    // Flags for the profile; unknown names get the "default" flags
    static std::string flags_for(const std::string& profile);

    static bool contains(const std::string& profile);
};

// Language codes the engine ships models for
class Languages {
public:
    static const std::map<std::string, std::string>& all();

    static bool is_supported(const std::string& code);

    // Display name, or the code itself when unknown
    static std::string name_of(const std::string& code);
};

} // namespace ocr_layout
