// Tests for TranscriptReconstructor

#include "transcript_reconstructor.hpp"
#include <iostream>
#include <cassert>

using namespace wordclip;

static AsrToken tok(const std::string& text, int id, double time) {
    AsrToken token;
    token.text = text;
    token.vocabulary_id = id;
    token.approximate_time = time;
    return token;
}

static AsrSegment seg(const std::string& text, double start, double end,
                      std::vector<AsrToken> tokens = {}) {
    AsrSegment segment;
    segment.text = text;
    segment.start = start;
    segment.end = end;
    segment.tokens = std::move(tokens);
    return segment;
}

void test_repeated_caption_dropped() {
    std::cout << "Testing repeated caption deduplication..." << std::endl;

    TranscriptReconstructor rec;
    auto units = rec.reconstruct({seg("hi", 0, 1), seg("hi", 1, 2)});

    assert(units.size() == 1);
    assert(units[0] == (TimestampedUnit{0, 1, "hi"}));

    // Only the immediately preceding unit counts
    units = rec.reconstruct({seg("hi", 0, 1), seg("bye", 1, 2), seg("hi", 2, 3)});
    assert(units.size() == 3);
    assert(units[2].text == "hi");

    std::cout << "  PASS" << std::endl;
}

void test_empty_segment_ignored() {
    std::cout << "Testing empty segments..." << std::endl;

    TranscriptReconstructor rec;
    auto units = rec.reconstruct({seg("", 0, 1), seg("after", 1, 2)});

    assert(units.size() == 1);
    assert(units[0].text == "after");
    assert(rec.reconstruct({}).empty());

    std::cout << "  PASS" << std::endl;
}

void test_word_boundaries() {
    std::cout << "Testing word boundaries..." << std::endl;

    TranscriptReconstructor rec;
    auto units = rec.reconstruct({
        seg("Hello world", 2.0, 4.0, {tok("Hello ", 100, 2.0), tok("wor", 101, 2.5), tok("ld", 102, 3.0)})
    });

    assert(units.size() == 2);
    assert(units[0] == (TimestampedUnit{2.0, 2.0, "Hello"}));
    // Word spans from its first token to the boundary token
    assert(units[1] == (TimestampedUnit{2.5, 3.0, "world"}));

    std::cout << "  PASS" << std::endl;
}

void test_special_tokens_skipped() {
    std::cout << "Testing special token filtering..." << std::endl;

    TranscriptReconstructor rec;
    assert(rec.special_token_threshold() == DEFAULT_SPECIAL_TOKEN_THRESHOLD);

    auto units = rec.reconstruct({
        seg("hi there", 0.0, 2.0, {
            tok("[_BEG_]", 50364, 0.0),
            tok("hi ", 10, 0.5),
            tok(" ", 11, 0.7),
            tok("there", 12, 1.0),
            tok("<|endoftext|>", 50258, 1.5),
        })
    });

    assert(units.size() == 2);
    assert(units[0] == (TimestampedUnit{0.5, 0.5, "hi"}));
    // Last token was special, so the trailing word closes at the segment end
    assert(units[1] == (TimestampedUnit{1.0, 2.0, "there"}));

    // Threshold comes from the engine
    TranscriptReconstructor custom(100);
    assert(custom.is_skippable(tok("word", 100, 0.0)));
    assert(!custom.is_skippable(tok("word", 99, 0.0)));
    assert(custom.is_skippable(tok("  ", 1, 0.0)));

    std::cout << "  PASS" << std::endl;
}

void test_unreadable_data_skipped() {
    std::cout << "Testing unreadable tokens and segments..." << std::endl;

    AsrToken broken = tok("", 0, 0.0);
    broken.readable = false;

    AsrSegment bad = seg("lost", 0.0, 1.0);
    bad.readable = false;

    TranscriptReconstructor rec;
    auto units = rec.reconstruct({
        bad,
        seg("ok fine", 1.0, 3.0, {tok("ok ", 1, 1.0), broken, tok("fine", 2, 2.0)}),
    });

    assert(units.size() == 2);
    assert(units[0].text == "ok");
    assert(units[1] == (TimestampedUnit{2.0, 2.0, "fine"}));

    std::cout << "  PASS" << std::endl;
}

void test_start_never_after_end() {
    std::cout << "Testing start <= end ordering..." << std::endl;

    TranscriptReconstructor rec;
    auto units = rec.reconstruct({
        seg("ab", 5.0, 6.0, {tok("a", 1, 5.0), tok("b", 2, 3.0)}),
        seg("caption", 6.0, 8.0),
        seg("c d", 8.0, 9.0, {tok("c ", 3, 8.0), tok("d ", 4, 8.0)}),
    });

    assert(units.size() == 4);
    assert(units[0].text == "ab");
    // Word end would be token b's 3.0; it is held at the word start instead
    assert(units[0] == (TimestampedUnit{5.0, 5.0, "ab"}));
    for (size_t i = 0; i < units.size(); ++i) {
        assert(units[i].start <= units[i].end);
        if (i > 0) assert(units[i - 1].start <= units[i].start);
    }

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Transcript Reconstructor Test Suite ===" << std::endl << std::endl;

    test_repeated_caption_dropped();
    test_empty_segment_ignored();
    test_word_boundaries();
    test_special_tokens_skipped();
    test_unreadable_data_skipped();
    test_start_never_after_end();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
