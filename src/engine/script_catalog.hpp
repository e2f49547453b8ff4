#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "engine/types.hpp"

namespace caserun::engine {

// Resolves a case reference to its source files. One authoritative lookup:
// either the case's files or a definitive not-found.
class ScriptCatalog {
public:
    virtual ~ScriptCatalog() = default;

    // Files keyed by path relative to the case directory, or nullopt when
    // the case does not exist
    virtual std::optional<FileMap> load_case(const CaseRef& ref) const = 0;
};

// Cases laid out as <root>/<book>/<chapter>/<case>/..., or
// <root>/<book>/<case>/... when the reference has no chapter.
class FilesystemCatalog : public ScriptCatalog {
public:
    explicit FilesystemCatalog(std::string root,
                               uint64_t max_file_bytes = 1024 * 1024,
                               size_t max_files = 256);

    std::optional<FileMap> load_case(const CaseRef& ref) const override;

    const std::string& root() const { return root_; }

private:
    std::string root_;
    uint64_t max_file_bytes_;
    size_t max_files_;
};

class MemoryCatalog : public ScriptCatalog {
public:
    void add_case(const CaseRef& ref, FileMap files);
    std::optional<FileMap> load_case(const CaseRef& ref) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, FileMap> cases_;
};

// Slugs are single path components: non-empty, no '/', not "." or ".."
bool is_valid_slug(const std::string& slug);

// Relative, no ".." component, no leading '/'
bool is_valid_relative_path(const std::string& path);

} // namespace caserun::engine
