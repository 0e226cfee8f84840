#pragma once

#include <archive.h>
#include <archive_entry.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/hot_updater_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

struct ArchiveEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
    // Link target for AE_IFLNK entries.
    std::string link_target;
};

enum class ArchiveFormat {
    Tar,
    Zip,
};

inline std::vector<std::uint8_t> BuildArchive(const std::vector<ArchiveEntry>& entries,
                                              ArchiveFormat format = ArchiveFormat::Zip) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    const int fr = (format == ArchiveFormat::Zip) ? archive_write_set_format_zip(a)
                                                  : archive_write_set_format_pax_restricted(a);
    if (fr != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        if (entry.file_type == AE_IFLNK)
            archive_entry_set_symlink(hdr, entry.link_target.c_str());
        const bool has_data = entry.file_type == AE_IFREG;
        archive_entry_set_size(hdr, has_data ? static_cast<la_int64_t>(entry.contents.size()) : 0);
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (has_data && !entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline bool WriteTextFile(const std::string& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) {
        return false;
    }
    os << content;
    return os.good();
}

inline bool WriteBytesFile(const std::string& path, const std::vector<std::uint8_t>& content) {
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) {
        return false;
    }
    os.write(reinterpret_cast<const char*>(content.data()),
             static_cast<std::streamsize>(content.size()));
    return os.good();
}

inline std::string ReadTextFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good())
        return {};
    return std::string((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

// A loadable content root: index.html naming `label`, plus one asset.
inline void MakeContentDir(const std::string& dir, const std::string& label) {
    WriteTextFile(dir + "/index.html", "<html>" + label + "</html>");
    WriteTextFile(dir + "/js/app.js", "console.log('" + label + "');");
}

// Update package with the content under "www/" (zip, like the hosted
// packages).
inline std::vector<std::uint8_t> BuildUpdatePackage(const std::string& label,
                                                    const std::string& prefix = "www/") {
    return BuildArchive({
        {prefix, "", AE_IFDIR, ""},
        {prefix + "index.html", "<html>" + label + "</html>", AE_IFREG, ""},
        {prefix + "js/app.js", "console.log('" + label + "');", AE_IFREG, ""},
    });
}

} // namespace testutil
