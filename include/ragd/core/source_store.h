/**
 * @file source_store.h
 * @brief On-disk knowledge sources and the index manifest under data_dir
 *
 * Layout:
 *   <data_dir>/sources/<alias>/...   one directory (or symlink) per source
 *   <data_dir>/index/manifest.json   written by every successful reindex
 */

#pragma once

#include "ragd/common.h"
#include "ragd/error.h"
#include "ragd/ipc/models.h"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ragd {

/**
 * @brief One source directory as found on disk
 */
struct SourceScan {
    SourceRecord record;
    std::vector<std::filesystem::path> documents;
};

struct ManifestEntry {
    std::string alias;
    std::string checksum;
    int documents = 0;
};

/**
 * @brief Result of the last successful reindex
 */
struct IndexManifest {
    std::string index_id;
    int catalog_version = 0;
    std::string built_at;
    std::string trigger_job_id;
    int document_count = 0;
    std::vector<ManifestEntry> sources;

    const ManifestEntry* find(const std::string& alias) const;

    json to_json() const;
    static Result<IndexManifest> from_json(const json& j);
};

/**
 * @brief Text excerpt matched by search()
 */
struct Snippet {
    std::string alias;
    std::string document_ref;
    std::string text;
    int score = 0;
};

struct SeedSource {
    std::string alias;
    std::string target;
};

/**
 * @brief File-backed source catalog
 *
 * Filesystem failures surface as std::filesystem::filesystem_error or
 * std::runtime_error; callers running inside a job or a request handler
 * let them propagate.
 */
class SourceStore {
public:
    explicit SourceStore(std::string data_dir);

    const std::filesystem::path& data_dir() const { return data_dir_; }
    std::filesystem::path sources_dir() const { return data_dir_ / "sources"; }
    std::filesystem::path index_dir() const { return data_dir_ / "index"; }
    std::filesystem::path manifest_path() const { return index_dir() / "manifest.json"; }

    /**
     * @brief Create data_dir, sources/ and index/ as needed
     * @return Directories that did not exist before
     */
    std::vector<std::string> ensure_layout() const;

    /**
     * @brief Link a seed source into sources/ unless the alias already exists
     * @return true if the link was created
     */
    bool seed(const SeedSource& seed) const;

    /**
     * @brief Every source directory, sorted by alias, with its checksum
     *
     * A source whose checksum matches the manifest is "active", any other
     * is "pending_validation".
     */
    std::vector<SourceScan> scan() const;

    std::optional<IndexManifest> load_manifest() const;

    /**
     * @brief Write the manifest atomically (temp file + rename)
     */
    void save_manifest(const IndexManifest& manifest) const;

    /**
     * @brief Lines of indexed text documents that mention the most terms
     * @param max_chars Upper bound on the total snippet text returned
     */
    std::vector<Snippet> search(const std::string& question, size_t limit, size_t max_chars) const;

    /**
     * @brief Stable content fingerprint of a set of documents
     */
    static std::string checksum(const std::filesystem::path& root,
                                const std::vector<std::filesystem::path>& documents);

private:
    std::filesystem::path data_dir_;
};

} // namespace ragd
