#include <attachd/cache/paginated_reader.h>
#include <attachd/cache/path_guard.h>
#include <attachd/common/base64.h>
#include <attachd/common/pattern_utils.h>
#include <attachd/common/utf8_utils.h>
#include <attachd/detection/binary_detector.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace attachd::cache {

namespace {

constexpr std::string_view kOctetStream = "application/octet-stream";

Result<BinaryPayload> readBinary(const fs::path& file, std::uint64_t cap,
                                 std::string contentType) {
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    if (ec) {
        return Error{ErrorCode::StorageError, "Cannot stat " + file.string() + ": " + ec.message()};
    }
    if (cap > 0 && size > cap) {
        return Error{ErrorCode::ResourceExhausted,
                     "Binary file is " + std::to_string(size) + " bytes; inline limit is " +
                         std::to_string(cap)};
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "File disappeared: " + file.filename().string()};
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::StorageError, "Failed reading " + file.string()};
    }

    BinaryPayload out;
    out.size = bytes.size();
    out.contentBase64 = common::base64Encode(bytes);
    out.contentType = contentType.empty() ? std::string(kOctetStream) : std::move(contentType);
    return out;
}

Result<TextPage> readTextWindow(const fs::path& file, std::uint64_t offset, std::uint64_t limit) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "File disappeared: " + file.filename().string()};
    }

    TextPage page;
    std::string line;
    std::uint64_t lineNo = 0;
    const std::uint64_t end = offset + limit;
    while (std::getline(in, line)) {
        if (lineNo >= offset && lineNo < end) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (page.linesReturned > 0) {
                page.content.push_back('\n');
            }
            page.content += std::to_string(lineNo + 1);
            page.content.push_back('\t');
            page.content += common::isValidUtf8(line) ? line : common::sanitizeUtf8(line);
            ++page.linesReturned;
        }
        ++lineNo;
    }
    if (in.bad()) {
        return Error{ErrorCode::StorageError, "Failed reading " + file.string()};
    }
    page.totalLines = lineNo;
    page.hasMore = offset + page.linesReturned < page.totalLines;
    return page;
}

} // namespace

Result<ReadResult> PaginatedReader::read(const AttachmentId& id, std::string_view path,
                                         std::int64_t offset, std::int64_t limit) const {
    if (offset < 0) {
        return Error{ErrorCode::InvalidArgument, "offset must be non-negative"};
    }
    if (limit < 0) {
        return Error{ErrorCode::InvalidArgument, "limit must be non-negative"};
    }

    auto root = store_.listingRoot(id);
    if (!root) {
        return root.error();
    }
    auto target = resolveConfined(root.value(), path);
    if (!target) {
        return target.error();
    }

    std::error_code ec;
    const auto st = fs::status(target.value(), ec);
    if (ec || !fs::exists(st)) {
        return Error{ErrorCode::NotFound, "File not found: " + std::string(path)};
    }
    if (fs::is_directory(st)) {
        return Error{ErrorCode::InvalidPath, "Path is a directory: " + std::string(path)};
    }
    if (!fs::is_regular_file(st)) {
        return Error{ErrorCode::InvalidPath, "Not a regular file: " + std::string(path)};
    }

    auto binary = detection::isBinaryFile(target.value());
    if (!binary) {
        return binary.error();
    }

    ReadResult result;
    result.path = common::normalize_path(path);

    if (binary.value()) {
        std::string contentType;
        if (root.value() == store_.originalDir(id)) {
            if (auto meta = store_.readMetadata(id)) {
                contentType = meta.value().contentType;
            }
        }
        if (contentType.empty()) {
            contentType = detection::guessMimeType(target.value().filename().string());
        }
        auto payload = readBinary(target.value(), options_.maxInlineBinaryBytes,
                                  std::move(contentType));
        if (!payload) {
            return payload.error();
        }
        result.payload = std::move(payload).value();
        return result;
    }

    auto page = readTextWindow(target.value(), static_cast<std::uint64_t>(offset),
                               static_cast<std::uint64_t>(limit));
    if (!page) {
        return page.error();
    }
    result.payload = std::move(page).value();
    return result;
}

} // namespace attachd::cache
