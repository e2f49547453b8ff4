#include "engine/script_catalog.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace caserun::engine {

bool is_valid_slug(const std::string& slug) {
    return !slug.empty() && slug != "." && slug != ".." &&
           slug.find('/') == std::string::npos &&
           slug.find('\0') == std::string::npos;
}

bool is_valid_relative_path(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.find('\0') != std::string::npos) {
        return false;
    }
    for (const auto& part : fs::path(path)) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

// ============================================================================
// FilesystemCatalog
// ============================================================================

FilesystemCatalog::FilesystemCatalog(std::string root, uint64_t max_file_bytes, size_t max_files)
    : root_(std::move(root))
    , max_file_bytes_(max_file_bytes)
    , max_files_(max_files) {}

std::optional<FileMap> FilesystemCatalog::load_case(const CaseRef& ref) const {
    if (!is_valid_slug(ref.book_slug) || !is_valid_slug(ref.case_slug) ||
        (!ref.chapter_slug.empty() && !is_valid_slug(ref.chapter_slug))) {
        return std::nullopt;
    }

    fs::path dir = fs::path(root_) / ref.book_slug;
    if (!ref.chapter_slug.empty()) {
        dir /= ref.chapter_slug;
    }
    dir /= ref.case_slug;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        spdlog::debug("Catalog: no case directory {}", dir.string());
        return std::nullopt;
    }

    FileMap files;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        const auto& name = it->path().filename().string();

        // Hidden entries and bytecode caches are not case content
        if (!name.empty() && (name[0] == '.' || name == "__pycache__")) {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        auto size = it->file_size(ec);
        if (ec || size > max_file_bytes_) {
            spdlog::debug("Catalog: skipping {} ({} bytes)", it->path().string(), size);
            ec.clear();
            continue;
        }
        if (files.size() >= max_files_) {
            spdlog::warn("Catalog: case {} has more than {} files, truncating",
                ref.to_string(), max_files_);
            break;
        }

        std::ifstream in(it->path(), std::ios::binary);
        if (!in.is_open()) {
            spdlog::warn("Catalog: cannot read {}", it->path().string());
            continue;
        }
        std::ostringstream content;
        content << in.rdbuf();

        files[fs::relative(it->path(), dir).generic_string()] = content.str();
    }

    if (ec) {
        spdlog::warn("Catalog: error walking {}: {}", dir.string(), ec.message());
    }

    spdlog::debug("Catalog: loaded {} files for {}", files.size(), ref.to_string());
    return files;
}

// ============================================================================
// MemoryCatalog
// ============================================================================

void MemoryCatalog::add_case(const CaseRef& ref, FileMap files) {
    std::lock_guard<std::mutex> lock(mutex_);
    cases_[ref.to_string()] = std::move(files);
}

std::optional<FileMap> MemoryCatalog::load_case(const CaseRef& ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cases_.find(ref.to_string());
    if (it == cases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace caserun::engine
