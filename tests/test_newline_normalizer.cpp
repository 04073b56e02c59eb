#include <doctest/doctest.h>

#include "../src/stream/newline_normalizer.h"

#include <transcode/encoding.h>
#include <transcode/error.h>

#include <string>
#include <vector>

using namespace transcode;
using namespace transcode::detail;

namespace {

std::string run_chunks(NewlineNormalizer& normalizer, const std::vector<std::string>& chunks) {
    bool pending_cr = false;
    std::string out;
    for (const auto& chunk : chunks) {
        out += normalizer.normalize_chunk(chunk, pending_cr);
    }
    out += normalizer.flush(pending_cr);
    CHECK_FALSE(pending_cr);
    return out;
}

} // namespace

TEST_CASE("NewlineNormalizer: every terminator becomes the target") {
    NewlineNormalizer lf(NewlineStyle::lf);
    CHECK(run_chunks(lf, {"a\r\nb\nc\rd"}) == "a\nb\nc\nd");

    NewlineNormalizer crlf(NewlineStyle::crlf);
    CHECK(run_chunks(crlf, {"a\r\nb\nc\rd"}) == "a\r\nb\r\nc\r\nd");

    NewlineNormalizer cr(NewlineStyle::cr);
    CHECK(run_chunks(cr, {"a\r\nb\nc\rd"}) == "a\rb\rc\rd");
}

TEST_CASE("NewlineNormalizer: CRLF split across chunks is one terminator") {
    NewlineNormalizer normalizer(NewlineStyle::lf);
    bool pending_cr = false;

    CHECK(normalizer.normalize_chunk("line one\r", pending_cr) == "line one");
    CHECK(pending_cr);
    CHECK(normalizer.normalize_chunk("\nline two", pending_cr) == "\nline two");
    CHECK_FALSE(pending_cr);
    CHECK(normalizer.flush(pending_cr).empty());

    CHECK(normalizer.counts().crlf == 1);
    CHECK(normalizer.counts().cr == 0);
    CHECK(normalizer.counts().lf == 0);
}

TEST_CASE("NewlineNormalizer: withheld CR followed by other text is a lone CR") {
    NewlineNormalizer normalizer(NewlineStyle::crlf);
    CHECK(run_chunks(normalizer, {"a\r", "b"}) == "a\r\nb");
    CHECK(normalizer.counts().cr == 1);
    CHECK(normalizer.counts().crlf == 0);
}

TEST_CASE("NewlineNormalizer: CR at end of input is flushed") {
    NewlineNormalizer normalizer(NewlineStyle::lf);
    CHECK(run_chunks(normalizer, {"a\r"}) == "a\n");
    CHECK(normalizer.counts().cr == 1);
}

TEST_CASE("NewlineNormalizer: empty chunk keeps the pending CR") {
    NewlineNormalizer normalizer(NewlineStyle::lf);
    bool pending_cr = false;

    CHECK(normalizer.normalize_chunk("x\r", pending_cr) == "x");
    CHECK(normalizer.normalize_chunk("", pending_cr).empty());
    CHECK(pending_cr);
    CHECK(normalizer.normalize_chunk("\n", pending_cr) == "\n");
    CHECK(normalizer.counts().crlf == 1);
}

TEST_CASE("NewlineNormalizer: output is the same for every chunking") {
    const std::string text = "one\r\ntwo\rthree\n\r\nfour\r\r\nfive\r";
    NewlineNormalizer whole(NewlineStyle::crlf);
    const std::string expected = run_chunks(whole, {text});
    CHECK(expected == "one\r\ntwo\r\nthree\r\n\r\nfour\r\n\r\nfive\r\n");

    for (std::size_t size = 1; size <= 5; ++size) {
        CAPTURE(size);
        std::vector<std::string> chunks;
        for (std::size_t pos = 0; pos < text.size(); pos += size) {
            chunks.push_back(text.substr(pos, size));
        }
        NewlineNormalizer normalizer(NewlineStyle::crlf);
        CHECK(run_chunks(normalizer, chunks) == expected);
        CHECK(normalizer.counts().crlf == 3);
        CHECK(normalizer.counts().cr == 3);
        CHECK(normalizer.counts().lf == 1);
    }
}

TEST_CASE("NewlineNormalizer: normalized text is unchanged") {
    NewlineNormalizer normalizer(NewlineStyle::crlf);
    CHECK(run_chunks(normalizer, {"a\r\nb\r\n"}) == "a\r\nb\r\n");
    CHECK_FALSE(normalizer.counts().mixed());
    CHECK(normalizer.counts().dominant() == NewlineStyle::crlf);
}

TEST_CASE("NewlineCounts: dominant style and mixing") {
    NewlineCounts none;
    CHECK(none.dominant() == NewlineStyle::lf);
    CHECK_FALSE(none.mixed());

    NewlineCounts counts;
    counts.lf = 10;
    counts.crlf = 1;
    CHECK(counts.dominant() == NewlineStyle::crlf);
    CHECK(counts.mixed());

    NewlineCounts only_cr;
    only_cr.cr = 2;
    CHECK(only_cr.dominant() == NewlineStyle::cr);
    CHECK(only_cr.total() == 2);
}

TEST_CASE("parse_newline_style") {
    CHECK(parse_newline_style("LF") == NewlineStyle::lf);
    CHECK(parse_newline_style("crlf") == NewlineStyle::crlf);
    CHECK(parse_newline_style("Cr") == NewlineStyle::cr);
    CHECK_THROWS_AS(parse_newline_style("LFCR"), ValueError);
    CHECK_THROWS_AS(parse_newline_style(""), ValueError);

    CHECK(to_string(NewlineStyle::crlf) == "CRLF");
    CHECK(terminator(NewlineStyle::cr) == "\r");
}
