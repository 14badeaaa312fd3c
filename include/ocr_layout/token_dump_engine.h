#pragma once

#include "ocr_layout/recognition_engine.h"
#include <string>
#include <vector>

namespace ocr_layout {

// Replays recorded engine output instead of running recognition. The
// "image" handed to recognize() is the path of a dump file:
//   *.tsv   the engine's TSV output (columns located through the header)
//   *.json  see JsonSerializer::tokens_from_json
// Language and flags are ignored. Stateless, so safe to share.
class TokenDumpEngine : public RecognitionEngine {
public:
    explicit TokenDumpEngine(std::vector<std::string> languages = {"eng"});

    std::vector<Token> recognize(const std::string& image,
                                 const std::string& language,
                                 const std::string& engine_flags) override;

    std::vector<std::string> available_languages() override { return languages_; }

    static std::vector<Token> parse_tsv(const std::string& content);

private:
    std::vector<std::string> languages_;
};

} // namespace ocr_layout
