#include "archive/archive_extractor.hpp"

#include "archive/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace hotupdate {

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = a ? archive_error_string(a) : nullptr;
    return s ? std::string(s) : std::string("unknown libarchive error");
}

Result Fail(const std::string& msg) {
    return Result::Fail(ErrorCode::ExtractionFailed, msg);
}

} // namespace

Result LibArchiveExtractor::Extract(const std::string& archive_path, const std::string& dest_dir) {
    namespace fs = std::filesystem;

    const fs::path base_dir(dest_dir);
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        return Result::Fail(ErrorCode::TempDirError,
                            "create_directories failed: " + dest_dir + ": " + ec.message());
    }
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ErrorCode::TempDirError, "Destination path is not a directory: " + dest_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Fail("archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (archive_read_open_filename(ar.get(), archive_path.c_str(), kReadBlockSize) != ARCHIVE_OK) {
        return Fail("archive_read_open_filename: " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Fail("archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dest_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy;

    std::uint64_t extracted = 0;
    std::size_t entries = 0;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN)
            return Fail("archive_read_next_header: " + ArchiveErr(ar.get()));

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        auto link_res = path_policy.CheckSymlinkTarget(rel, archive_entry_symlink(entry));
        if (!link_res.is_ok()) return link_res;

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeLinkTarget(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("extract entry: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return Fail("archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Fail("archive_read_data_block: " + ArchiveErr(ar.get()));

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return Fail("archive_write_data_block: " + ArchiveErr(aw.get()));

            extracted += static_cast<std::uint64_t>(size);
            if (opt_.max_total_bytes > 0 && extracted > opt_.max_total_bytes) {
                return Fail("archive exceeds size limit of " +
                            std::to_string(opt_.max_total_bytes) + " bytes");
            }
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return Fail("archive_write_finish_entry: " + ArchiveErr(aw.get()));
        ++entries;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Fail("archive_write_close: " + ArchiveErr(aw.get()));
    }

    if (entries == 0) {
        return Fail("archive contains no entries: " + archive_path);
    }

    LogInfo("Extracted %zu entries (%llu bytes) -> %s",
            entries, (unsigned long long)extracted, dest_dir.c_str());
    return Result::Ok();
}

} // namespace hotupdate
