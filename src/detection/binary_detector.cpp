#include <attachd/detection/binary_detector.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <string>
#include <utility>

namespace attachd::detection {

namespace {

// Length of the UTF-8 sequence introduced by a lead byte, 0 for an invalid lead byte.
size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 4;
    return 0;
}

bool validSecondByte(unsigned char lead, unsigned char c1) {
    if ((c1 & 0xC0) != 0x80)
        return false;
    // Reject overlong encodings, UTF-16 surrogates and code points above U+10FFFF.
    if (lead == 0xE0 && c1 < 0xA0)
        return false;
    if (lead == 0xED && c1 > 0x9F)
        return false;
    if (lead == 0xF0 && c1 < 0x90)
        return false;
    if (lead == 0xF4 && c1 > 0x8F)
        return false;
    return true;
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 32> kMimeByExtension{{
    {".txt", "text/plain"},
    {".log", "text/plain"},
    {".csv", "text/csv"},
    {".md", "text/markdown"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".xml", "application/xml"},
    {".json", "application/json"},
    {".yaml", "application/yaml"},
    {".yml", "application/yaml"},
    {".js", "application/javascript"},
    {".sh", "application/x-sh"},
    {".py", "text/x-python"},
    {".conf", "text/plain"},
    {".ini", "text/plain"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".webp", "image/webp"},
    {".svg", "image/svg+xml"},
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".tgz", "application/gzip"},
    {".bz2", "application/x-bzip2"},
    {".tbz2", "application/x-bzip2"},
    {".mp3", "audio/mpeg"},
    {".mp4", "video/mp4"},
    {".har", "application/json"},
}};

} // namespace

bool isBinaryData(std::span<const std::byte> data) noexcept {
    if (data.empty())
        return false;

    const size_t checkLength = std::min(data.size(), BINARY_SNIFF_SIZE);
    size_t controlChars = 0;

    size_t i = 0;
    while (i < checkLength) {
        const auto c = static_cast<unsigned char>(data[i]);
        if (c == 0)
            return true;

        if (c < 0x80) {
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v' &&
                c != 0x1B) {
                ++controlChars;
            } else if (c == 0x7F) {
                ++controlChars;
            }
            ++i;
            continue;
        }

        const size_t len = sequenceLength(c);
        if (len == 0)
            return true;

        const size_t available = checkLength - i;
        const size_t present = std::min(len, available);
        if (present >= 2 && !validSecondByte(c, static_cast<unsigned char>(data[i + 1])))
            return true;
        for (size_t k = 2; k < present; ++k) {
            if ((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80)
                return true;
        }
        // present < len only happens at the end of the sniffed prefix
        i += present;
    }

    return controlChars * 10 > checkLength;
}

Result<bool> isBinaryFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open file: " + path.string()};
    }
    std::string prefix(BINARY_SNIFF_SIZE, '\0');
    in.read(prefix.data(), static_cast<std::streamsize>(prefix.size()));
    if (in.bad()) {
        return Error{ErrorCode::StorageError, "Failed to read file: " + path.string()};
    }
    prefix.resize(static_cast<size_t>(in.gcount()));
    return isBinaryData(std::string_view(prefix));
}

std::string guessMimeType(std::string_view filename) {
    auto dot = filename.find_last_of('.');
    if (dot == std::string_view::npos)
        return {};
    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    for (const auto& [suffix, mime] : kMimeByExtension) {
        if (suffix == ext)
            return std::string(mime);
    }
    return {};
}

} // namespace attachd::detection
