#include "semantic_index.hpp"
#include "log.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace wordclip {

namespace {

Status dimension_mismatch(size_t expected, size_t actual) {
    return Status::error(ErrorCode::DimensionMismatch,
                         "embedding has " + std::to_string(actual) + " dimensions, index expects " +
                             std::to_string(expected));
}

} // namespace

SemanticIndex::SemanticIndex(size_t dimension) : dimension_(dimension) {}

Status SemanticIndex::insert(const TimestampedUnit& unit, std::vector<float> vector, int64_t* id) {
    if (vector.size() != dimension_) {
        return dimension_mismatch(dimension_, vector.size());
    }

    EmbeddingRecord record;
    record.id = next_id_++;
    record.start = unit.start;
    record.end = unit.end;
    record.text = unit.text;
    record.vector = std::move(vector);

    if (id) *id = record.id;
    records_.push_back(std::move(record));
    return Status::success();
}

Status SemanticIndex::populate(const std::vector<TimestampedUnit>& units, Embedder& embedder,
                               size_t batch_size) {
    if (batch_size == 0) batch_size = 1;

    records_.reserve(records_.size() + units.size());

    for (size_t begin = 0; begin < units.size(); begin += batch_size) {
        const size_t end = std::min(units.size(), begin + batch_size);

        std::vector<std::string> texts;
        texts.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            texts.push_back(units[i].text);
        }

        std::vector<std::vector<float>> vectors;
        Status status = embedder.batch_embed(texts, vectors);
        if (!status.ok()) return status;

        if (vectors.size() != texts.size()) {
            return Status::error(ErrorCode::ExternalTool,
                                 "embedder returned " + std::to_string(vectors.size()) +
                                     " vectors for " + std::to_string(texts.size()) + " texts");
        }
        for (const auto& v : vectors) {
            if (v.size() != dimension_) return dimension_mismatch(dimension_, v.size());
        }

        for (size_t i = begin; i < end; ++i) {
            status = insert(units[i], std::move(vectors[i - begin]));
            if (!status.ok()) return status;
        }
        log_debug("Indexed " + std::to_string(end) + "/" + std::to_string(units.size()) + " units");
    }

    return Status::success();
}

float SemanticIndex::cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) return 1.0f;

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return 1.0f;

    const double distance = 1.0 - dot / (std::sqrt(na) * std::sqrt(nb));
    // NaN/inf components rank last so the ordering stays strict-weak
    if (!std::isfinite(distance)) return MAX_COSINE_DISTANCE;
    return static_cast<float>(distance);
}

Status SemanticIndex::query(const std::string& text, size_t k, Embedder& embedder,
                            std::vector<EmbeddingRecord>& results) const {
    results.clear();
    if (records_.empty() || k == 0) return Status::success();

    std::vector<float> query_vec;
    Status status = embedder.embed(text, query_vec);
    if (!status.ok()) return status;

    return query_vector(query_vec, k, results);
}

Status SemanticIndex::query_vector(const std::vector<float>& query, size_t k,
                                   std::vector<EmbeddingRecord>& results) const {
    results.clear();
    if (query.size() != dimension_) {
        return dimension_mismatch(dimension_, query.size());
    }
    if (records_.empty() || k == 0) return Status::success();

    std::vector<std::pair<float, size_t>> ranked;
    ranked.reserve(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        ranked.emplace_back(cosine_distance(query, records_[i].vector), i);
    }

    const size_t n = std::min(k, ranked.size());
    // Position breaks distance ties so equal scores come back in insertion order
    std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(n), ranked.end());

    results.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        results.push_back(records_[ranked[i].second]);
    }
    return Status::success();
}

const EmbeddingRecord* SemanticIndex::get(int64_t id) const {
    if (id < 1 || id > static_cast<int64_t>(records_.size())) return nullptr;
    return &records_[static_cast<size_t>(id - 1)];
}

Status SemanticIndex::neighbors(int64_t id, size_t before, size_t after,
                                std::vector<EmbeddingRecord>& results) const {
    results.clear();

    const EmbeddingRecord* target = get(id);
    if (!target) {
        return Status::error(ErrorCode::NotFound, "no record with id " + std::to_string(id));
    }

    std::vector<const EmbeddingRecord*> earlier;
    std::vector<const EmbeddingRecord*> later;
    for (const auto& record : records_) {
        if (record.id == id) continue;
        if (record.start < target->start) {
            earlier.push_back(&record);
        } else if (record.start > target->start) {
            later.push_back(&record);
        }
    }

    auto chronological = [](const EmbeddingRecord* a, const EmbeddingRecord* b) {
        if (a->start != b->start) return a->start < b->start;
        return a->id < b->id;
    };
    std::sort(earlier.begin(), earlier.end(), chronological);
    std::sort(later.begin(), later.end(), chronological);

    // Closest `before` records preceding the target are the tail of `earlier`
    const size_t n_before = std::min(before, earlier.size());
    const size_t n_after = std::min(after, later.size());

    results.reserve(n_before + 1 + n_after);
    for (size_t i = earlier.size() - n_before; i < earlier.size(); ++i) {
        results.push_back(*earlier[i]);
    }
    results.push_back(*target);
    for (size_t i = 0; i < n_after; ++i) {
        results.push_back(*later[i]);
    }

    return Status::success();
}

std::vector<EmbeddingRecord> SemanticIndex::range(double start, double end) const {
    std::vector<EmbeddingRecord> results;
    for (const auto& record : records_) {
        const bool start_inside = record.start >= start && record.start <= end;
        const bool end_inside = record.end >= start && record.end <= end;
        if (start_inside || end_inside) {
            results.push_back(record);
        }
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const EmbeddingRecord& a, const EmbeddingRecord& b) {
                         return a.start < b.start;
                     });
    return results;
}

Clip collapse_window(const std::vector<EmbeddingRecord>& window) {
    Clip clip;
    if (window.empty()) return clip;

    std::vector<std::string> texts;
    texts.reserve(window.size());
    for (const auto& record : window) {
        texts.push_back(record.text);
    }

    clip.start = window.front().start;
    clip.end = window.back().end;
    clip.label = text::join(texts, "\n");
    return clip;
}

} // namespace wordclip
