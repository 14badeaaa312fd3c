#include "ocr_layout/dump_catalog.h"
#include "ocr_layout/text_utils.h"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace ocr_layout {

bool DumpCatalog::is_dump(const fs::path& path) {
    std::string name = text_utils::to_lower_ascii(path.filename().string());
    if (text_utils::ends_with(name, kOutputSuffix)) {
        return false;
    }
    return text_utils::ends_with(name, ".tsv") || text_utils::ends_with(name, ".json");
}

std::vector<std::string> DumpCatalog::collect(const fs::path& root, const fs::path& skip_dir) {
    fs::path skip = skip_dir.empty() ? fs::path() : fs::weakly_canonical(skip_dir);
    std::vector<std::string> dumps;

    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_directory()) {
            if (!skip.empty() && fs::weakly_canonical(it->path()) == skip) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file() && is_dump(it->path())) {
            dumps.push_back(it->path().string());
        }
    }

    std::sort(dumps.begin(), dumps.end());
    return dumps;
}

fs::path DumpCatalog::output_path(const fs::path& dump, const fs::path& root,
                                  const fs::path& output_dir) {
    std::error_code ec;
    fs::path relative = fs::relative(dump, root, ec);
    if (ec || relative.empty() || relative.begin()->string() == "..") {
        relative = dump.filename();
    }
    return output_dir / relative.parent_path() / (relative.filename().string() + kOutputSuffix);
}

} // namespace ocr_layout
