#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ocr_layout {

// Finds token dumps under a directory and names the JSON report for each.
// Reports keep the dump's path relative to the input root and its full
// file name, so a/x.tsv, b/x.tsv and x.json never share an output.
class DumpCatalog {
public:
    static constexpr const char* kOutputSuffix = "_ocr.json";

    // .tsv or .json (any case), excluding reports written by a previous run
    static bool is_dump(const std::filesystem::path& path);

    // Every dump below root, sorted. Nothing inside skip_dir is visited.
    static std::vector<std::string> collect(const std::filesystem::path& root,
                                            const std::filesystem::path& skip_dir = {});

    // output_dir / <dump relative to root> + kOutputSuffix
    static std::filesystem::path output_path(const std::filesystem::path& dump,
                                             const std::filesystem::path& root,
                                             const std::filesystem::path& output_dir);
};

} // namespace ocr_layout
