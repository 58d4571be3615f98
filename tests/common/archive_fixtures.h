// Builds small archives on disk with libarchive for extraction tests.

#pragma once

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace attachd::test {

struct ArchiveMember {
    enum class Kind { File, Directory, Symlink, Hardlink };

    std::string path;
    std::string data;
    Kind kind = Kind::File;
    std::string linkTarget;

    static ArchiveMember file(std::string path, std::string data) {
        return {std::move(path), std::move(data), Kind::File, {}};
    }
    static ArchiveMember dir(std::string path) { return {std::move(path), {}, Kind::Directory, {}}; }
    static ArchiveMember symlink(std::string path, std::string target) {
        return {std::move(path), {}, Kind::Symlink, std::move(target)};
    }
    static ArchiveMember hardlink(std::string path, std::string target) {
        return {std::move(path), {}, Kind::Hardlink, std::move(target)};
    }
};

enum class TestArchiveFormat { Tar, TarGz, Zip };

/**
 * @brief Write `members` to `path` and return the archive bytes. Throws on libarchive errors.
 */
inline std::string write_archive(const std::filesystem::path& path,
                                 const std::vector<ArchiveMember>& members,
                                 TestArchiveFormat format) {
    struct archive* a = archive_write_new();
    auto check = [a](int rc, const char* what) {
        if (rc < ARCHIVE_WARN) {
            std::string msg = std::string(what) + ": " +
                              (archive_error_string(a) ? archive_error_string(a) : "unknown");
            archive_write_free(a);
            throw std::runtime_error(msg);
        }
    };

    switch (format) {
        case TestArchiveFormat::Zip:
            check(archive_write_set_format_zip(a), "set zip");
            break;
        case TestArchiveFormat::TarGz:
            check(archive_write_add_filter_gzip(a), "add gzip");
            check(archive_write_set_format_pax_restricted(a), "set tar");
            break;
        case TestArchiveFormat::Tar:
            check(archive_write_set_format_pax_restricted(a), "set tar");
            break;
    }
    std::filesystem::create_directories(path.parent_path());
    check(archive_write_open_filename(a, path.string().c_str()), "open");

    for (const auto& m : members) {
        struct archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, m.path.c_str());
        switch (m.kind) {
            case ArchiveMember::Kind::File:
                archive_entry_set_filetype(e, AE_IFREG);
                archive_entry_set_perm(e, 0644);
                archive_entry_set_size(e, static_cast<la_int64_t>(m.data.size()));
                break;
            case ArchiveMember::Kind::Directory:
                archive_entry_set_filetype(e, AE_IFDIR);
                archive_entry_set_perm(e, 0755);
                archive_entry_set_size(e, 0);
                break;
            case ArchiveMember::Kind::Symlink:
                archive_entry_set_filetype(e, AE_IFLNK);
                archive_entry_set_perm(e, 0777);
                archive_entry_set_symlink(e, m.linkTarget.c_str());
                archive_entry_set_size(e, 0);
                break;
            case ArchiveMember::Kind::Hardlink:
                archive_entry_set_filetype(e, AE_IFREG);
                archive_entry_set_perm(e, 0644);
                archive_entry_set_hardlink(e, m.linkTarget.c_str());
                archive_entry_set_size(e, 0);
                break;
        }
        const int rc = archive_write_header(a, e);
        if (rc >= ARCHIVE_WARN && m.kind == ArchiveMember::Kind::File && !m.data.empty()) {
            archive_write_data(a, m.data.data(), m.data.size());
        }
        archive_entry_free(e);
        check(rc, "write header");
    }

    check(archive_write_close(a), "close");
    archive_write_free(a);

    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace attachd::test
