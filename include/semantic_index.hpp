#pragma once

#include "embedder.hpp"
#include "status.hpp"
#include "types.hpp"
#include <cstdint>
#include <vector>

namespace wordclip {

constexpr float MAX_COSINE_DISTANCE = 2.0f;

// In-memory nearest-neighbor store over embedded transcript units.
//
// Records get ids 1, 2, 3, ... in insertion order; ids are never reused and records are
// never removed, so the index owns a plain vector with record i at position id - 1.
// Population is single-writer. Once populated the index is read-only and the const
// queries may run from several threads.
class SemanticIndex {
public:
    explicit SemanticIndex(size_t dimension);

    SemanticIndex(const SemanticIndex&) = delete;
    SemanticIndex& operator=(const SemanticIndex&) = delete;

    // Fails with DimensionMismatch if vector.size() != dimension()
    Status insert(const TimestampedUnit& unit, std::vector<float> vector, int64_t* id = nullptr);

    // Embeds `units` in batches of `batch_size` and inserts them in input order.
    // A batch is checked in full before any of it is inserted.
    Status populate(const std::vector<TimestampedUnit>& units, Embedder& embedder,
                    size_t batch_size = 32);

    // Up to k records ranked by ascending cosine distance to the embedded query text
    Status query(const std::string& text, size_t k, Embedder& embedder,
                 std::vector<EmbeddingRecord>& results) const;
    Status query_vector(const std::vector<float>& query, size_t k,
                        std::vector<EmbeddingRecord>& results) const;

    // Chronological context around record `id`: up to `before` records starting strictly
    // earlier, the record itself, then up to `after` records starting strictly later.
    // Fewer than requested at either end of the timeline is not an error.
    Status neighbors(int64_t id, size_t before, size_t after,
                     std::vector<EmbeddingRecord>& results) const;

    // Records whose start or end falls inside [start, end], ordered by start
    std::vector<EmbeddingRecord> range(double start, double end) const;

    // nullptr if no such id
    const EmbeddingRecord* get(int64_t id) const;

    size_t size() const { return records_.size(); }
    size_t dimension() const { return dimension_; }

    // 1 - cosine similarity; 1.0 when either vector has zero length,
    // MAX_COSINE_DISTANCE when either holds a non-finite component
    static float cosine_distance(const std::vector<float>& a, const std::vector<float>& b);

private:
    size_t dimension_;
    int64_t next_id_ = 1;
    std::vector<EmbeddingRecord> records_;
};

// Clip spanning first.start .. last.end of a neighbor window, labelled with the
// newline-joined record texts
Clip collapse_window(const std::vector<EmbeddingRecord>& window);

} // namespace wordclip
