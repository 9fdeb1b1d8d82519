#include "zip_archive.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>
#include <system_error>

namespace relaycp {

namespace fs = std::filesystem;

namespace {

constexpr size_t kIoBlock = 64 * 1024;

struct WriteDeleter {
    void operator()(archive* a) const noexcept { archive_write_free(a); }
};
struct ReadDeleter {
    void operator()(archive* a) const noexcept { archive_read_free(a); }
};
struct EntryDeleter {
    void operator()(archive_entry* e) const noexcept { archive_entry_free(e); }
};
using EntryPtr = std::unique_ptr<archive_entry, EntryDeleter>;

[[noreturn]] void throw_archive(archive* a, const std::string& what) {
    const char* msg = archive_error_string(a);
    throw std::runtime_error(what + ": " + (msg ? msg : "unknown archive error"));
}

// Name of the last component, also for "dir/" and ".".
std::string dir_label(const fs::path& dir) {
    fs::path p = fs::absolute(dir).lexically_normal();
    if (!p.has_filename()) p = p.parent_path();
    return p.filename().string();
}

class ZipWriter {
public:
    explicit ZipWriter(const std::string& path) : a_(archive_write_new()) {
        if (!a_) throw std::runtime_error("archive_write_new failed");
        if (archive_write_set_format_zip(a_.get()) != ARCHIVE_OK) throw_archive(a_.get(), "zip format");
        if (archive_write_open_filename(a_.get(), path.c_str()) != ARCHIVE_OK) {
            throw_archive(a_.get(), "cannot create " + path);
        }
    }

    void add_dir(const std::string& name) {
        EntryPtr e(archive_entry_new());
        archive_entry_set_pathname(e.get(), (name + "/").c_str());
        archive_entry_set_filetype(e.get(), AE_IFDIR);
        archive_entry_set_perm(e.get(), 0755);
        archive_entry_set_size(e.get(), 0);
        if (archive_write_header(a_.get(), e.get()) != ARCHIVE_OK) throw_archive(a_.get(), "writing " + name);
    }

    void add_file(const std::string& name, const fs::path& src) {
        std::ifstream in(src, std::ios::binary);
        if (!in.is_open()) throw std::runtime_error("cannot open " + src.string());
        const auto size = fs::file_size(src);

        EntryPtr e(archive_entry_new());
        archive_entry_set_pathname(e.get(), name.c_str());
        archive_entry_set_filetype(e.get(), AE_IFREG);
        archive_entry_set_perm(e.get(), 0644);
        archive_entry_set_size(e.get(), static_cast<la_int64_t>(size));
        if (archive_write_header(a_.get(), e.get()) != ARCHIVE_OK) throw_archive(a_.get(), "writing " + name);

        std::vector<char> buf(kIoBlock);
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const auto n = in.gcount();
            if (n <= 0) break;
            if (archive_write_data(a_.get(), buf.data(), static_cast<size_t>(n)) < 0) {
                throw_archive(a_.get(), "writing " + name);
            }
        }
        if (in.bad()) throw std::runtime_error("read error on " + src.string());
    }

    // Adds src below prefix: a file as prefix itself, a directory as
    // prefix/ followed by its contents in name order.
    void add_tree(const fs::path& src, const std::string& prefix) {
        const auto st = fs::symlink_status(src);
        if (fs::is_symlink(st)) return;
        if (fs::is_regular_file(st)) {
            add_file(prefix, src);
            return;
        }
        if (!fs::is_directory(st)) return;

        add_dir(prefix);
        std::vector<fs::path> children;
        for (const auto& entry : fs::directory_iterator(src)) children.push_back(entry.path());
        std::sort(children.begin(), children.end());
        for (const auto& child : children) add_tree(child, prefix + "/" + child.filename().string());
    }

    void close() {
        if (archive_write_close(a_.get()) != ARCHIVE_OK) throw_archive(a_.get(), "finishing archive");
    }

private:
    std::unique_ptr<archive, WriteDeleter> a_;
};

class ZipReader {
public:
    explicit ZipReader(const std::string& path) : a_(archive_read_new()) {
        if (!a_) throw std::runtime_error("archive_read_new failed");
        archive_read_support_format_zip(a_.get());
        if (archive_read_open_filename(a_.get(), path.c_str(), kIoBlock) != ARCHIVE_OK) {
            throw_archive(a_.get(), "cannot open " + path);
        }
    }

    // False at the end of the archive.
    bool next(archive_entry*& e) {
        int r = archive_read_next_header(a_.get(), &e);
        if (r == ARCHIVE_EOF) return false;
        if (r < ARCHIVE_WARN) throw_archive(a_.get(), "reading archive");
        return true;
    }

    archive* get() { return a_.get(); }

private:
    std::unique_ptr<archive, ReadDeleter> a_;
};

std::string entry_name(archive_entry* e) {
    const char* name = archive_entry_pathname(e);
    if (!name) name = archive_entry_pathname_utf8(e);
    return name ? std::string(name) : std::string();
}

std::string strip_first_component(const std::string& name) {
    auto slash = name.find('/');
    return slash == std::string::npos ? std::string() : name.substr(slash + 1);
}

void check_limits(uint64_t uncompressed, uint64_t archive_size, const ZipLimits& limits) {
    if (limits.max_uncompressed && uncompressed > limits.max_uncompressed) {
        throw std::runtime_error("archive too large: " + std::to_string(uncompressed) + " bytes (max " +
                                 std::to_string(limits.max_uncompressed) + ")");
    }
    if (limits.max_ratio && archive_size > 0 && uncompressed / archive_size > limits.max_ratio) {
        throw std::runtime_error("suspicious compression ratio: " + std::to_string(uncompressed / archive_size) +
                                 ":1 (max " + std::to_string(limits.max_ratio) + ":1)");
    }
}

} // namespace

void zip_directory(const std::string& dir, const std::string& zip_path) {
    if (!fs::is_directory(dir)) throw std::runtime_error(dir + " is not a directory");
    ZipWriter w(zip_path);
    w.add_tree(dir, dir_label(dir));
    w.close();
}

void zip_paths(const std::vector<std::string>& paths, const std::string& root, const std::string& zip_path) {
    std::set<std::string> names;
    for (const auto& p : paths) {
        if (!fs::exists(p)) throw std::runtime_error("cannot open " + p);
        if (!names.insert(dir_label(p)).second) throw std::runtime_error("duplicate name " + dir_label(p));
    }

    ZipWriter w(zip_path);
    w.add_dir(root);
    for (const auto& p : paths) w.add_tree(p, root + "/" + dir_label(p));
    w.close();
}

std::string safe_extract_path(const std::string& target_dir, const std::string& entry) {
    if (entry.find('\0') != std::string::npos) throw std::runtime_error("illegal null byte in path");
    const fs::path rel = fs::path(entry).lexically_normal();
    if (rel.has_root_name() || rel.has_root_directory()) {
        throw std::runtime_error("illegal absolute path: " + entry);
    }

    fs::path base = fs::absolute(target_dir).lexically_normal();
    if (!base.has_filename()) base = base.parent_path();
    fs::path full = (base / rel).lexically_normal();
    if (!full.has_filename()) full = full.parent_path();

    auto mismatch = std::mismatch(base.begin(), base.end(), full.begin(), full.end());
    if (mismatch.first != base.end()) throw std::runtime_error("illegal path escape: " + entry);
    return full.string();
}

std::vector<std::string> extract_zip(const std::string& zip_path,
                                     const std::string& target_dir,
                                     bool strip_root,
                                     bool overwrite,
                                     const ZipLimits& limits) {
    const uint64_t archive_size = fs::file_size(zip_path);

    // Declared sizes first, so nothing is written for an oversized archive.
    {
        ZipReader scan(zip_path);
        archive_entry* e = nullptr;
        uint64_t declared = 0;
        while (scan.next(e)) {
            if (archive_entry_size_is_set(e)) declared += static_cast<uint64_t>(archive_entry_size(e));
            safe_extract_path(target_dir, entry_name(e));
        }
        check_limits(declared, archive_size, limits);
    }

    fs::create_directories(target_dir);

    ZipReader r(zip_path);
    archive_entry* e = nullptr;
    std::vector<std::string> written;
    std::vector<char> buf(kIoBlock);
    uint64_t total = 0;

    while (r.next(e)) {
        std::string name = entry_name(e);
        if (strip_root) name = strip_first_component(name);
        if (name.empty()) continue;

        const fs::path out = safe_extract_path(target_dir, name);
        const auto type = archive_entry_filetype(e);
        if (type == AE_IFDIR || name.back() == '/') {
            fs::create_directories(out);
            continue;
        }
        if (type != AE_IFREG) continue;

        std::error_code ec;
        if (fs::exists(out, ec) && !overwrite) throw std::runtime_error(out.string() + " already exists");
        fs::create_directories(out.parent_path());
        std::ofstream f(out, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) throw std::runtime_error("cannot write " + out.string());

        try {
            for (;;) {
                la_ssize_t n = archive_read_data(r.get(), buf.data(), buf.size());
                if (n < 0) throw_archive(r.get(), "extracting " + name);
                if (n == 0) break;
                total += static_cast<uint64_t>(n);
                check_limits(total, archive_size, limits);
                f.write(buf.data(), n);
            }
            f.close();
            if (!f) throw std::runtime_error("write failed: " + out.string());
        } catch (const std::exception&) {
            f.close();
            fs::remove(out, ec);
            throw;
        }
        written.push_back(out.string());
    }
    return written;
}

size_t count_files(const std::string& dir) {
    size_t n = 0;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (!entry.is_symlink() && entry.is_regular_file()) ++n;
    }
    return n;
}

} // namespace relaycp
