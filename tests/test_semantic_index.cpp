// Tests for SemanticIndex with a deterministic stub embedder

#include "semantic_index.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <cassert>

using namespace wordclip;

// Looks vectors up by exact text; anything unknown maps to the last axis
class StubEmbedder : public Embedder {
public:
    explicit StubEmbedder(size_t dimension) : dimension_(dimension) {}

    void set(const std::string& text, std::vector<float> vector) { table_[text] = std::move(vector); }

    Status embed(const std::string& text, std::vector<float>& vector) override {
        ++embed_calls;
        auto it = table_.find(text);
        if (it != table_.end()) {
            vector = it->second;
        } else {
            vector.assign(dimension_, 0.0f);
            vector.back() = 1.0f;
        }
        return Status::success();
    }

    Status batch_embed(const std::vector<std::string>& texts,
                       std::vector<std::vector<float>>& vectors) override {
        ++batch_calls;
        vectors.clear();
        for (const auto& text : texts) {
            std::vector<float> v;
            embed(text, v);
            vectors.push_back(v);
        }
        return Status::success();
    }

    size_t dimension() const override { return dimension_; }

    int embed_calls = 0;
    int batch_calls = 0;

private:
    size_t dimension_;
    std::map<std::string, std::vector<float>> table_;
};

// Returns vectors of a fixed, possibly wrong, length or fails outright
class BrokenEmbedder : public Embedder {
public:
    BrokenEmbedder(size_t length, bool fail) : length_(length), fail_(fail) {}

    Status embed(const std::string&, std::vector<float>& vector) override {
        if (fail_) return Status::error(ErrorCode::ExternalTool, "embedding failed");
        vector.assign(length_, 1.0f);
        return Status::success();
    }

    Status batch_embed(const std::vector<std::string>& texts,
                       std::vector<std::vector<float>>& vectors) override {
        if (fail_) return Status::error(ErrorCode::ExternalTool, "embedding failed");
        vectors.assign(texts.size(), std::vector<float>(length_, 1.0f));
        return Status::success();
    }

    size_t dimension() const override { return length_; }

private:
    size_t length_;
    bool fail_;
};

static std::vector<TimestampedUnit> numbered_units(int count) {
    std::vector<TimestampedUnit> units;
    for (int i = 0; i < count; ++i) {
        units.push_back({i * 2.0, i * 2.0 + 1.5, "unit " + std::to_string(i + 1)});
    }
    return units;
}

void test_populate_assigns_ids() {
    std::cout << "Testing population and id assignment..." << std::endl;

    StubEmbedder embedder(3);
    SemanticIndex index(3);

    Status status = index.populate(numbered_units(7), embedder, 3);
    assert(status.ok());
    assert(index.size() == 7);
    assert(index.dimension() == 3);
    // Batches of 3: 3 + 3 + 1
    assert(embedder.batch_calls == 3);

    for (int64_t id = 1; id <= 7; ++id) {
        const EmbeddingRecord* record = index.get(id);
        assert(record != nullptr);
        assert(record->id == id);
        assert(record->text == "unit " + std::to_string(id));
        assert(record->vector.size() == 3);
    }
    assert(index.get(0) == nullptr);
    assert(index.get(8) == nullptr);

    // Ids keep counting across inserts
    int64_t id = 0;
    assert(index.insert({20.0, 21.0, "extra"}, {1.0f, 0.0f, 0.0f}, &id).ok());
    assert(id == 8);

    std::cout << "  PASS" << std::endl;
}

void test_dimension_mismatch() {
    std::cout << "Testing dimension mismatch..." << std::endl;

    SemanticIndex index(4);

    Status status = index.insert({0, 1, "short"}, {1.0f, 2.0f});
    assert(status.code == ErrorCode::DimensionMismatch);
    assert(index.size() == 0);

    BrokenEmbedder wrong(3, false);
    status = index.populate(numbered_units(5), wrong);
    assert(status.code == ErrorCode::DimensionMismatch);
    assert(index.size() == 0);

    std::vector<EmbeddingRecord> results;
    status = index.query_vector({1.0f}, 1, results);
    assert(status.code == ErrorCode::DimensionMismatch);

    std::cout << "  PASS" << std::endl;
}

void test_embedder_failure_propagates() {
    std::cout << "Testing embedder failure..." << std::endl;

    BrokenEmbedder failing(2, true);
    SemanticIndex index(2);

    Status status = index.populate(numbered_units(2), failing);
    assert(status.code == ErrorCode::ExternalTool);
    assert(index.size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_query_ranking() {
    std::cout << "Testing query ranking..." << std::endl;

    StubEmbedder embedder(4);
    embedder.set("apple", {1.0f, 0.0f, 0.0f, 0.0f});
    embedder.set("banana", {0.0f, 1.0f, 0.0f, 0.0f});
    embedder.set("cherry", {0.0f, 0.0f, 1.0f, 0.0f});
    embedder.set("apple-ish", {0.6f, 0.05f, 0.0f, 0.0f});
    embedder.set("fruit bowl", {0.9f, 0.4f, 0.1f, 0.0f});

    SemanticIndex index(4);
    assert(index.populate({{0, 1, "apple"}, {1, 2, "banana"}, {2, 3, "cherry"}, {3, 4, "apple-ish"}},
                          embedder).ok());

    std::vector<EmbeddingRecord> results;
    assert(index.query("fruit bowl", 3, embedder, results).ok());
    assert(results.size() == 3);
    assert(results[0].text == "apple-ish");
    assert(results[1].text == "apple");
    assert(results[2].text == "banana");

    // k larger than the index
    assert(index.query("cherry", 10, embedder, results).ok());
    assert(results.size() == 4);
    assert(results[0].text == "cherry");

    assert(index.query("cherry", 0, embedder, results).ok());
    assert(results.empty());

    std::cout << "  PASS" << std::endl;
}

void test_query_empty_index() {
    std::cout << "Testing query on empty index..." << std::endl;

    StubEmbedder embedder(2);
    SemanticIndex index(2);

    std::vector<EmbeddingRecord> results;
    results.push_back(EmbeddingRecord{});
    assert(index.query("anything", 5, embedder, results).ok());
    assert(results.empty());
    assert(embedder.embed_calls == 0);

    std::cout << "  PASS" << std::endl;
}

void test_neighbors_window() {
    std::cout << "Testing neighbor expansion..." << std::endl;

    StubEmbedder embedder(2);
    SemanticIndex index(2);
    assert(index.populate(numbered_units(9), embedder).ok());

    std::vector<EmbeddingRecord> window;
    assert(index.neighbors(5, 1, 1, window).ok());
    assert(window.size() == 3);
    assert(window[0].id == 4);
    assert(window[1].id == 5);
    assert(window[2].id == 6);

    assert(index.neighbors(5, 3, 2, window).ok());
    assert(window.size() == 6);
    assert(window.front().id == 2);
    assert(window.back().id == 7);
    for (size_t i = 1; i < window.size(); ++i) {
        assert(window[i - 1].start < window[i].start);
    }

    std::cout << "  PASS" << std::endl;
}

void test_neighbors_at_boundaries() {
    std::cout << "Testing neighbor expansion at sequence boundaries..." << std::endl;

    StubEmbedder embedder(2);
    SemanticIndex index(2);
    assert(index.populate(numbered_units(9), embedder).ok());

    std::vector<EmbeddingRecord> window;
    assert(index.neighbors(1, 5, 0, window).ok());
    assert(window.size() == 1);
    assert(window[0].id == 1);

    assert(index.neighbors(9, 2, 5, window).ok());
    assert(window.size() == 3);
    assert(window[0].id == 7);
    assert(window[2].id == 9);

    Status status = index.neighbors(10, 1, 1, window);
    assert(status.code == ErrorCode::NotFound);
    assert(window.empty());
    assert(index.neighbors(0, 1, 1, window).code == ErrorCode::NotFound);

    std::cout << "  PASS" << std::endl;
}

void test_neighbors_use_time_order() {
    std::cout << "Testing neighbor expansion with interleaved tracks..." << std::endl;

    SemanticIndex index(1);
    // Insertion order differs from time order
    assert(index.insert({10, 11, "c"}, {1.0f}).ok());   // id 1
    assert(index.insert({0, 1, "a"}, {1.0f}).ok());     // id 2
    assert(index.insert({5, 6, "b"}, {1.0f}).ok());     // id 3
    assert(index.insert({5, 7, "b2"}, {1.0f}).ok());    // id 4, same start as id 3
    assert(index.insert({20, 21, "d"}, {1.0f}).ok());   // id 5

    std::vector<EmbeddingRecord> window;
    assert(index.neighbors(3, 5, 5, window).ok());

    // Records sharing the target's start are neither before nor after it
    assert(window.size() == 4);
    assert(window[0].text == "a");
    assert(window[1].text == "b");
    assert(window[2].text == "c");
    assert(window[3].text == "d");

    std::cout << "  PASS" << std::endl;
}

void test_range_and_collapse() {
    std::cout << "Testing range lookup and window collapse..." << std::endl;

    StubEmbedder embedder(2);
    SemanticIndex index(2);
    // unit k spans [2(k-1), 2(k-1) + 1.5]
    assert(index.populate(numbered_units(5), embedder).ok());

    auto hits = index.range(3.0, 6.2);
    assert(hits.size() == 3);
    assert(hits[0].text == "unit 2");
    assert(hits[2].text == "unit 4");

    assert(index.range(100.0, 200.0).empty());

    std::vector<EmbeddingRecord> window;
    assert(index.neighbors(3, 1, 1, window).ok());
    Clip clip = collapse_window(window);
    assert(clip.start == 2.0);
    assert(clip.end == 7.5);
    assert(clip.label == "unit 2\nunit 3\nunit 4");

    Clip empty = collapse_window({});
    assert(empty.label.empty());

    std::cout << "  PASS" << std::endl;
}

void test_cosine_distance() {
    std::cout << "Testing cosine distance..." << std::endl;

    assert(std::fabs(SemanticIndex::cosine_distance({1, 0}, {1, 0})) < 1e-6f);
    assert(std::fabs(SemanticIndex::cosine_distance({1, 0}, {0, 1}) - 1.0f) < 1e-6f);
    assert(std::fabs(SemanticIndex::cosine_distance({1, 0}, {-1, 0}) - 2.0f) < 1e-6f);
    assert(std::fabs(SemanticIndex::cosine_distance({2, 0}, {5, 0})) < 1e-6f);
    assert(SemanticIndex::cosine_distance({0, 0}, {1, 0}) == 1.0f);
    assert(SemanticIndex::cosine_distance({1, 0}, {1, 0, 0}) == 1.0f);

    std::cout << "  PASS" << std::endl;
}

void test_nan_record_ranks_last() {
    std::cout << "Testing non-finite vectors in ranking..." << std::endl;

    const float nan = std::numeric_limits<float>::quiet_NaN();

    SemanticIndex index(2);
    assert(index.insert({0, 1, "a"}, {0.1f, 1.0f}).ok());
    assert(index.insert({1, 2, "b"}, {nan, nan}).ok());
    assert(index.insert({2, 3, "c"}, {1.0f, 0.0f}).ok());
    assert(index.insert({3, 4, "d"}, {0.9f, 0.1f}).ok());

    std::vector<EmbeddingRecord> results;
    assert(index.query_vector({1.0f, 0.0f}, 2, results).ok());
    assert(results.size() == 2);
    assert(results[0].text == "c");
    assert(results[1].text == "d");

    assert(index.query_vector({1.0f, 0.0f}, 4, results).ok());
    assert(results.back().text == "b");

    assert(SemanticIndex::cosine_distance({nan, 0}, {1, 0}) == MAX_COSINE_DISTANCE);
    const float inf = std::numeric_limits<float>::infinity();
    assert(SemanticIndex::cosine_distance({inf, 1}, {1, 0}) == MAX_COSINE_DISTANCE);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Semantic Index Test Suite ===" << std::endl << std::endl;

    test_populate_assigns_ids();
    test_dimension_mismatch();
    test_embedder_failure_propagates();
    test_query_ranking();
    test_query_empty_index();
    test_neighbors_window();
    test_neighbors_at_boundaries();
    test_neighbors_use_time_order();
    test_range_and_collapse();
    test_cosine_distance();
    test_nan_record_ranks_last();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
