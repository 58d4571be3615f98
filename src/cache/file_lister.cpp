#include <attachd/cache/file_lister.h>
#include <attachd/cache/path_guard.h>
#include <attachd/common/pattern_utils.h>

namespace attachd::cache {

Result<std::vector<FileInfo>> FileLister::list(const AttachmentId& id,
                                               std::string_view pattern) const {
    auto root = store_.listingRoot(id);
    if (!root) {
        return root.error();
    }
    auto tree = collectTree(root.value());
    if (!tree) {
        return tree.error();
    }
    if (pattern.empty()) {
        pattern = kDefaultListPattern;
    }

    std::vector<FileInfo> out;
    for (auto& info : tree.value()) {
        if (common::glob_match_path(info.path, pattern)) {
            out.push_back(info);
        }
    }
    return out;
}

} // namespace attachd::cache
