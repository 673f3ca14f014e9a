#pragma once

#include "../types.hpp"
#include "content_hash.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace duet {
namespace engine {

/**
 * @brief Write side of the embedding/similarity engine: `store(text) -> ok/err`.
 *
 * Implementations honor the context's deadline and cancellation flag.
 */
class ISemanticStore {
public:
    virtual ~ISemanticStore() = default;
    virtual Expected<void> store(const std::string& text, const CallContext& ctx = CallContext{}) = 0;
};

struct SemanticMatch {
    std::string id;
    std::string text;
    double score = 0.0;
};

/**
 * @brief In-memory lexical index with optional JSON persistence.
 *
 * Documents are addressed by the SHA-256 of their text, so storing the same
 * response twice keeps one entry. Retrieval scores by term overlap
 * normalized like a cosine over binary term vectors.
 *
 * @threadsafety All public operations lock an internal mutex.
 */
class InMemorySemanticStore : public ISemanticStore {
public:
    /// With a path, every store() rewrites the snapshot at that path.
    explicit InMemorySemanticStore(std::optional<std::string> persist_path = std::nullopt)
        : persist_path_(std::move(persist_path))
    {}

    Expected<void> store(const std::string& text, const CallContext& ctx = CallContext{}) override {
        if (auto ok = ctx.check(); !ok) {
            return ok;
        }
        if (text.empty()) {
            return tl::unexpected(Error{ErrorCode::ValidationFailed, "Semantic store text cannot be empty"});
        }
        std::lock_guard<std::mutex> lock(mutex_);
        add_locked(sha256_hex(text), text);
        if (persist_path_) {
            return save_locked(*persist_path_);
        }
        return {};
    }

    /// Top-k documents sharing terms with `query`, best first.
    std::vector<SemanticMatch> search(const std::string& query, int top_k = 4) const {
        const auto query_terms = tokenize_terms(query);
        std::lock_guard<std::mutex> lock(mutex_);
        if (query_terms.empty()) {
            return {};
        }

        std::unordered_map<size_t, int> overlap;
        for (const auto& term : query_terms) {
            auto postings = inverted_index_.find(term);
            if (postings == inverted_index_.end()) continue;
            for (size_t idx : postings->second) {
                overlap[idx] += 1;
            }
        }

        std::vector<SemanticMatch> matches;
        matches.reserve(overlap.size());
        for (const auto& [idx, shared] : overlap) {
            const double denom = std::sqrt(
                static_cast<double>(query_terms.size()) *
                static_cast<double>(std::max<size_t>(1, doc_terms_[idx].size())));
            matches.push_back(SemanticMatch{docs_[idx].id, docs_[idx].text, static_cast<double>(shared) / denom});
        }
        std::sort(matches.begin(), matches.end(), [](const SemanticMatch& a, const SemanticMatch& b) {
            return a.score == b.score ? a.id < b.id : a.score > b.score;
        });
        if (matches.size() > static_cast<size_t>(std::max(1, top_k))) {
            matches.resize(static_cast<size_t>(std::max(1, top_k)));
        }
        return matches;
    }

    Expected<void> save(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return save_locked(path);
    }

    Expected<void> load(const std::string& path) {
        std::ifstream in(path);
        if (!in.is_open()) {
            return tl::unexpected(Error{ErrorCode::Unknown, "Failed to open semantic store file for reading", path});
        }
        nlohmann::json root;
        try {
            in >> root;
        } catch (const std::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::Unknown,
                std::string("Failed to parse semantic store JSON: ") + e.what(),
                path
            });
        }
        if (!root.contains("documents") || !root["documents"].is_array()) {
            return tl::unexpected(Error{ErrorCode::Unknown, "Invalid semantic store JSON: missing 'documents' array", path});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        clear_locked();
        for (const auto& item : root["documents"]) {
            if (!item.contains("id") || !item.contains("text")) {
                continue;
            }
            add_locked(item["id"].get<std::string>(), item["text"].get<std::string>());
        }
        return {};
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return docs_.size();
    }

private:
    struct Document {
        std::string id;
        std::string text;
    };

    void add_locked(const std::string& id, const std::string& text) {
        if (id_to_index_.count(id) > 0) {
            return;
        }
        const size_t idx = docs_.size();
        id_to_index_[id] = idx;
        docs_.push_back(Document{id, text});
        doc_terms_.emplace_back();
        for (const auto& term : tokenize_terms(text)) {
            doc_terms_[idx].insert(term);
            inverted_index_[term].push_back(idx);
        }
    }

    void clear_locked() {
        docs_.clear();
        doc_terms_.clear();
        id_to_index_.clear();
        inverted_index_.clear();
    }

    Expected<void> save_locked(const std::string& path) const {
        nlohmann::json root;
        root["documents"] = nlohmann::json::array();
        for (const auto& doc : docs_) {
            root["documents"].push_back({{"id", doc.id}, {"text", doc.text}});
        }
        std::ofstream out(path);
        if (!out.is_open()) {
            return tl::unexpected(Error{ErrorCode::Unknown, "Failed to open semantic store file for writing", path});
        }
        out << root.dump(2);
        return {};
    }

    static std::vector<std::string> tokenize_terms(const std::string& text) {
        std::vector<std::string> terms;
        std::string current;
        for (const unsigned char ch : text) {
            if (std::isalnum(ch) != 0) {
                current.push_back(static_cast<char>(std::tolower(ch)));
            } else if (!current.empty()) {
                terms.push_back(current);
                current.clear();
            }
        }
        if (!current.empty()) {
            terms.push_back(current);
        }
        std::sort(terms.begin(), terms.end());
        terms.erase(std::unique(terms.begin(), terms.end()), terms.end());
        return terms;
    }

    std::optional<std::string> persist_path_;
    std::vector<Document> docs_;
    std::vector<std::unordered_set<std::string>> doc_terms_;
    std::unordered_map<std::string, size_t> id_to_index_;
    std::unordered_map<std::string, std::vector<size_t>> inverted_index_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace duet
