#include <doctest/doctest.h>

#include "../src/codec/codec.h"
#include "../src/codec/encoding_registry.h"
#include "../src/stream/chunk_state.h"
#include "../src/stream/stream_decoder.h"
#include "../src/stream/stream_encoder.h"

#include <transcode/error.h>

#include <string>

using namespace transcode;
using namespace transcode::detail;

namespace {

const std::string kMixedUtf8 =
    "caf\xC3\xA9 \xE2\x82\xAC 5, na\xC3\xAFve \xF0\x9F\x98\x80 "
    "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E \xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82";

// "日本語のテキストです。" in UTF-8.
const std::string kJapaneseUtf8 =
    "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E\xE3\x81\xAE\xE3\x83\x86\xE3\x82\xAD"
    "\xE3\x82\xB9\xE3\x83\x88\xE3\x81\xA7\xE3\x81\x99\xE3\x80\x82";

std::string encode_all(const std::string& encoding, const std::string& utf8) {
    StreamEncoder encoder(make_encoder(resolve_encoding(encoding)));
    std::string bytes = encoder.encode_chunk(utf8, true);
    REQUIRE(encoder.replacements() == 0);
    return bytes;
}

// Feed bytes in fixed-size chunks, then the zero-length final call.
std::string decode_in_chunks(const std::string& encoding, const std::string& bytes,
                             std::size_t chunk_size, std::size_t* replacements = nullptr) {
    EncodingInfo info = resolve_encoding(encoding);
    StreamDecoder decoder(make_decoder(info));
    ChunkState state;
    std::string text;
    for (std::size_t pos = 0; pos < bytes.size(); pos += chunk_size) {
        text += decoder.decode_chunk(std::string_view(bytes).substr(pos, chunk_size), state, false);
        CHECK(state.pending_decode_bytes.size() < info.max_sequence_length);
    }
    text += decoder.decode_chunk({}, state, true);
    CHECK(state.pending_decode_bytes.empty());
    if (replacements) *replacements = decoder.replacements();
    return text;
}

} // namespace

TEST_CASE("StreamDecoder: UTF-8 split at every chunk size") {
    for (std::size_t chunk = 1; chunk <= 7; ++chunk) {
        CAPTURE(chunk);
        std::size_t replacements = 99;
        CHECK(decode_in_chunks("utf-8", kMixedUtf8, chunk, &replacements) == kMixedUtf8);
        CHECK(replacements == 0);
    }
}

TEST_CASE("StreamDecoder: multi-byte encodings split at every chunk size") {
    for (const char* encoding : {"shift_jis", "euc-jp", "gbk", "utf-16le", "utf-16be", "utf-32le"}) {
        CAPTURE(encoding);
        std::string bytes = encode_all(encoding, kJapaneseUtf8);
        for (std::size_t chunk = 1; chunk <= 7; ++chunk) {
            CAPTURE(chunk);
            std::size_t replacements = 99;
            CHECK(decode_in_chunks(encoding, bytes, chunk, &replacements) == kJapaneseUtf8);
            CHECK(replacements == 0);
        }
    }
}

TEST_CASE("StreamDecoder: UTF-16 surrogate pair split across chunks") {
    std::string emoji = "\xF0\x9F\x98\x80";  // U+1F600
    std::string bytes = encode_all("utf-16le", "a" + emoji + "b");
    REQUIRE(bytes.size() == 8);
    for (std::size_t chunk = 1; chunk <= 7; ++chunk) {
        CAPTURE(chunk);
        CHECK(decode_in_chunks("utf-16le", bytes, chunk) == "a" + emoji + "b");
    }
}

TEST_CASE("StreamDecoder: incomplete sequence is carried in the chunk state") {
    StreamDecoder decoder(make_decoder(resolve_encoding("utf-8")));
    ChunkState state;

    CHECK(decoder.decode_chunk("x\xE2\x82", state, false) == "x");
    CHECK(state.pending_decode_bytes == "\xE2\x82");

    CHECK(decoder.decode_chunk("\xAC y", state, false) == "\xE2\x82\xAC y");
    CHECK(state.pending_decode_bytes.empty());
    CHECK(decoder.replacements() == 0);
}

TEST_CASE("StreamDecoder: truncated sequence at end of input becomes U+FFFD") {
    StreamDecoder decoder(make_decoder(resolve_encoding("utf-8")));
    ChunkState state;

    std::string text = decoder.decode_chunk("ok\xE2\x82", state, false);
    text += decoder.decode_chunk({}, state, true);
    CHECK(text == "ok\xEF\xBF\xBD");
    CHECK(decoder.replacements() == 1);
    CHECK(state.pending_decode_bytes.empty());
}

TEST_CASE("StreamDecoder: invalid bytes are replaced, never thrown") {
    StreamDecoder decoder(make_decoder(resolve_encoding("utf-8")));
    ChunkState state;

    std::string text = decoder.decode_chunk("a\xFF" "b", state, true);
    CHECK(text == "a\xEF\xBF\xBD" "b");
    CHECK(decoder.replacements() == 1);
}

TEST_CASE("StreamDecoder: single-byte encodings never carry") {
    StreamDecoder decoder(make_decoder(resolve_encoding("iso-8859-1")));
    ChunkState state;

    CHECK(decoder.decode_chunk("\xE9t\xE9", state, false) == "\xC3\xA9t\xC3\xA9");
    CHECK(state.pending_decode_bytes.empty());
}

TEST_CASE("StreamDecoder: unmarked generic UTF-16 is read big-endian") {
    StreamDecoder decoder(make_decoder(resolve_encoding("utf-16")));
    ChunkState state;

    std::string raw("\x00h\x00i", 4);
    CHECK(decoder.decode_chunk(raw, state, true) == "hi");
    CHECK(decoder.encoding().name == "utf-16be");
}

TEST_CASE("StreamEncoder: unrepresentable characters are substituted and counted") {
    StreamEncoder encoder(make_encoder(resolve_encoding("iso-8859-1")));

    std::string bytes = encoder.encode_chunk("caf\xC3\xA9 \xE2\x82\xAC", false);
    bytes += encoder.encode_chunk({}, true);
    CHECK(bytes == "caf\xE9 ?");
    CHECK(encoder.replacements() == 1);
}

TEST_CASE("StreamEncoder: explicit byte orders write no BOM") {
    StreamEncoder encoder(make_encoder(resolve_encoding("utf-16le")));

    std::string bytes = encoder.encode_chunk("hi", true);
    CHECK(bytes == std::string("h\x00i\x00", 4));
}
