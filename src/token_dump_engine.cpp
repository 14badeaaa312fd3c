#include "ocr_layout/token_dump_engine.h"
#include "ocr_layout/errors.h"
#include "ocr_layout/json_serializer.h"
#include "ocr_layout/text_utils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace ocr_layout {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw RecognitionError("Cannot open token dump: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

size_t column_index(const std::map<std::string, size_t>& columns, const std::string& name) {
    auto it = columns.find(name);
    if (it == columns.end()) {
        throw MalformedTokenError("TSV header has no '" + name + "' column");
    }
    return it->second;
}

} // namespace

TokenDumpEngine::TokenDumpEngine(std::vector<std::string> languages)
    : languages_(std::move(languages)) {}

std::vector<Token> TokenDumpEngine::recognize(const std::string& image,
                                              const std::string& /*language*/,
                                              const std::string& /*engine_flags*/) {
    if (!fs::exists(image)) {
        throw RecognitionError("Token dump not found: " + image);
    }

    auto ext = text_utils::to_lower_ascii(fs::path(image).extension().string());

    std::string content = read_file(image);

    if (ext == ".tsv") {
        return parse_tsv(content);
    }
    if (ext == ".json") {
        return JsonSerializer::tokens_from_json(nlohmann::json::parse(content));
    }

    throw RecognitionError("Unsupported token dump format: " + image);
}

std::vector<Token> TokenDumpEngine::parse_tsv(const std::string& content) {
    std::istringstream stream(content);
    std::string line;

    if (!std::getline(stream, line)) {
        return {};
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::map<std::string, size_t> columns;
    auto header = text_utils::split(line, "\t");
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }

    size_t left = column_index(columns, "left");
    size_t top = column_index(columns, "top");
    size_t width = column_index(columns, "width");
    size_t height = column_index(columns, "height");
    size_t conf = column_index(columns, "conf");
    size_t text = column_index(columns, "text");
    size_t required = std::max({left, top, width, height, conf});

    std::vector<Token> tokens;
    size_t row = 1;

    while (std::getline(stream, line)) {
        ++row;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        auto fields = text_utils::split(line, "\t");
        if (fields.size() <= required) {
            throw MalformedTokenError("TSV row " + std::to_string(row) + " has " +
                                      std::to_string(fields.size()) + " fields");
        }

        Token token;
        try {
            token.x = std::stoi(fields[left]);
            token.y = std::stoi(fields[top]);
            token.width = std::stoi(fields[width]);
            token.height = std::stoi(fields[height]);
            token.confidence = std::stod(fields[conf]);
        } catch (const std::logic_error& e) {
            throw MalformedTokenError("TSV row " + std::to_string(row) + ": " + e.what());
        }
        // Non-word rows end right after the conf column
        if (text < fields.size()) {
            token.text = fields[text];
        }

        tokens.push_back(std::move(token));
    }

    return tokens;
}

} // namespace ocr_layout
