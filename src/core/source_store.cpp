/**
 * @file source_store.cpp
 * @brief File-backed source catalog and index manifest
 */

#include "ragd/core/source_store.h"
#include "ragd/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace ragd {

namespace {

constexpr uint64_t FNV_OFFSET = 1469598103934665603ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

// Files larger than this are never read by search()
constexpr uintmax_t MAX_SEARCH_FILE_BYTES = 1u << 20;

void fnv_mix(uint64_t& hash, const std::string& data) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
}

std::string hex64(uint64_t value) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return buf;
}

int64_t mtime_of(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return static_cast<int64_t>(st.st_mtime);
}

std::vector<std::string> terms_of(const std::string& text) {
    std::set<std::string> seen;
    std::vector<std::string> terms;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= 3 && seen.insert(current).second) {
            terms.push_back(current);
        }
        current.clear();
    };
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_') {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
    return terms;
}

bool looks_binary(const std::string& head) {
    return head.find('\0') != std::string::npos;
}

}  // namespace

// ============================================================================
// IndexManifest
// ============================================================================

const ManifestEntry* IndexManifest::find(const std::string& alias) const {
    for (const auto& entry : sources) {
        if (entry.alias == alias) {
            return &entry;
        }
    }
    return nullptr;
}

json IndexManifest::to_json() const {
    json list = json::array();
    for (const auto& entry : sources) {
        list.push_back({
            {"alias", entry.alias},
            {"checksum", entry.checksum},
            {"documents", entry.documents}
        });
    }
    return {
        {"index_id", index_id},
        {"catalog_version", catalog_version},
        {"built_at", built_at},
        {"trigger_job_id", trigger_job_id},
        {"document_count", document_count},
        {"sources", list}
    };
}

Result<IndexManifest> IndexManifest::from_json(const json& j) {
    if (!j.is_object()) {
        return Result<IndexManifest>::failure(ErrorKind::DECODE, "manifest is not an object");
    }
    try {
        IndexManifest manifest;
        manifest.index_id = j.value("index_id", "");
        manifest.catalog_version = j.value("catalog_version", 0);
        manifest.built_at = j.value("built_at", "");
        manifest.trigger_job_id = j.value("trigger_job_id", "");
        manifest.document_count = j.value("document_count", 0);
        if (j.contains("sources") && j["sources"].is_array()) {
            for (const auto& item : j["sources"]) {
                ManifestEntry entry;
                entry.alias = item.value("alias", "");
                entry.checksum = item.value("checksum", "");
                entry.documents = item.value("documents", 0);
                manifest.sources.push_back(entry);
            }
        }
        return Result<IndexManifest>::success(std::move(manifest));
    } catch (const json::exception& e) {
        return Result<IndexManifest>::failure(ErrorKind::DECODE,
            "invalid manifest: " + std::string(e.what()));
    }
}

// ============================================================================
// SourceStore
// ============================================================================

SourceStore::SourceStore(std::string data_dir)
    : data_dir_(expand_path(data_dir)) {
}

std::vector<std::string> SourceStore::ensure_layout() const {
    std::vector<std::string> created;
    for (const auto& dir : {data_dir_, sources_dir(), index_dir()}) {
        if (fs::create_directories(dir)) {
            created.push_back(dir.string());
            LOG_INFO("SourceStore", "Created directory: " + dir.string());
        }
    }
    return created;
}

bool SourceStore::seed(const SeedSource& seed) const {
    fs::path link = sources_dir() / seed.alias;
    std::error_code ec;
    if (fs::exists(fs::symlink_status(link, ec))) {
        return false;
    }
    if (!fs::is_directory(seed.target, ec)) {
        LOG_DEBUG("SourceStore", "Seed target missing, skipping: " + seed.target);
        return false;
    }
    fs::create_directory_symlink(seed.target, link);
    LOG_INFO("SourceStore", "Seeded source " + seed.alias + " -> " + seed.target);
    return true;
}

std::string SourceStore::checksum(const fs::path& root, const std::vector<fs::path>& documents) {
    std::vector<fs::path> sorted = documents;
    std::sort(sorted.begin(), sorted.end());

    uint64_t hash = FNV_OFFSET;
    for (const auto& doc : sorted) {
        std::error_code ec;
        auto size = fs::file_size(doc, ec);
        std::string line = fs::relative(doc, root, ec).generic_string();
        line += '\0' + std::to_string(ec ? 0 : size);
        line += '\0' + std::to_string(mtime_of(doc)) + '\n';
        fnv_mix(hash, line);
    }
    return hex64(hash);
}

std::vector<SourceScan> SourceStore::scan() const {
    std::vector<SourceScan> result;
    if (!fs::is_directory(sources_dir())) {
        return result;
    }

    auto manifest = load_manifest();

    for (const auto& entry : fs::directory_iterator(sources_dir())) {
        if (!entry.is_directory()) {
            continue;
        }

        SourceScan scan;
        const fs::path root = entry.path();
        int64_t newest = mtime_of(root);
        uintmax_t total = 0;

        for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied);
             it != fs::recursive_directory_iterator(); ++it) {
            std::error_code ec;
            if (!it->is_regular_file(ec)) {
                continue;
            }
            scan.documents.push_back(it->path());
            total += it->file_size(ec);
            newest = std::max(newest, mtime_of(it->path()));
        }

        SourceRecord& rec = scan.record;
        rec.alias = root.filename().string();
        rec.type = fs::is_symlink(entry.symlink_status()) ? "linked" : "directory";
        rec.location = fs::is_symlink(entry.symlink_status())
            ? fs::read_symlink(root).string() : root.string();
        rec.language = "en";
        rec.size_bytes = static_cast<int64_t>(total);
        rec.last_updated = to_iso(Clock::from_time_t(static_cast<std::time_t>(newest)));
        rec.checksum = checksum(root, scan.documents);

        const ManifestEntry* indexed = manifest ? manifest->find(rec.alias) : nullptr;
        rec.status = (indexed && indexed->checksum == rec.checksum) ? "active" : "pending_validation";

        result.push_back(std::move(scan));
    }

    std::sort(result.begin(), result.end(), [](const SourceScan& a, const SourceScan& b) {
        return a.record.alias < b.record.alias;
    });
    return result;
}

std::optional<IndexManifest> SourceStore::load_manifest() const {
    std::ifstream file(manifest_path());
    if (!file.good()) {
        return std::nullopt;
    }
    try {
        json j = json::parse(file);
        auto manifest = IndexManifest::from_json(j);
        if (!manifest.ok()) {
            LOG_WARN("SourceStore", manifest.error.to_string());
            return std::nullopt;
        }
        return manifest.value;
    } catch (const json::exception& e) {
        LOG_WARN("SourceStore", "Unreadable manifest: " + std::string(e.what()));
        return std::nullopt;
    }
}

void SourceStore::save_manifest(const IndexManifest& manifest) const {
    fs::create_directories(index_dir());
    fs::path tmp = manifest_path();
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.good()) {
            throw std::runtime_error("cannot write " + tmp.string());
        }
        file << manifest.to_json().dump(2) << "\n";
        if (!file.good()) {
            throw std::runtime_error("short write to " + tmp.string());
        }
    }
    fs::rename(tmp, manifest_path());
}

std::vector<Snippet> SourceStore::search(const std::string& question, size_t limit, size_t max_chars) const {
    std::vector<Snippet> hits;
    auto terms = terms_of(question);
    auto manifest = load_manifest();
    if (terms.empty() || !manifest) {
        return hits;
    }

    for (const auto& scan : scan()) {
        if (!manifest->find(scan.record.alias)) {
            continue;
        }
        for (const auto& doc : scan.documents) {
            std::error_code ec;
            if (fs::file_size(doc, ec) > MAX_SEARCH_FILE_BYTES || ec) {
                continue;
            }
            std::ifstream file(doc);
            std::stringstream buffer;
            buffer << file.rdbuf();
            std::string content = buffer.str();
            if (looks_binary(content.substr(0, 512))) {
                continue;
            }

            std::istringstream lines(content);
            std::string line;
            int line_no = 0;
            while (std::getline(lines, line)) {
                ++line_no;
                std::string lowered = line;
                std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                int score = 0;
                for (const auto& term : terms) {
                    if (lowered.find(term) != std::string::npos) {
                        ++score;
                    }
                }
                if (score > 0) {
                    std::string ref = fs::relative(doc, sources_dir() / scan.record.alias, ec).generic_string();
                    hits.push_back({scan.record.alias, ref + ":" + std::to_string(line_no), trim(line), score});
                }
            }
        }
    }

    std::stable_sort(hits.begin(), hits.end(), [](const Snippet& a, const Snippet& b) {
        return a.score > b.score;
    });

    std::vector<Snippet> selected;
    size_t used = 0;
    for (auto& hit : hits) {
        if (selected.size() >= limit || used + hit.text.size() > max_chars) {
            break;
        }
        used += hit.text.size();
        selected.push_back(std::move(hit));
    }
    return selected;
}

} // namespace ragd
