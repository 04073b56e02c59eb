#include <doctest/doctest.h>

#include "../src/codec/encoding_registry.h"

#include <transcode/encoding.h>
#include <transcode/error.h>

using namespace transcode;
using namespace transcode::detail;

TEST_CASE("EncodingRegistry: canonical names for common labels") {
    CHECK(canonical_encoding_name("utf-8") == "utf-8");
    CHECK(canonical_encoding_name("UTF_8") == "utf-8");
    CHECK(canonical_encoding_name("utf8") == "utf-8");
    CHECK(canonical_encoding_name("latin-1") == "iso-8859-1");
    CHECK(canonical_encoding_name("Latin1") == "iso-8859-1");
    CHECK(canonical_encoding_name("cp1252") == "windows-1252");
    CHECK(canonical_encoding_name("UTF-16LE") == "utf-16le");
    CHECK(canonical_encoding_name("Shift_JIS") == "shift_jis");
    CHECK(canonical_encoding_name(" koi8_r ") == "koi8-r");
}

TEST_CASE("EncodingRegistry: unknown names are rejected") {
    CHECK_THROWS_AS(resolve_encoding("no-such-encoding"), LookupError);
    CHECK_THROWS_AS(resolve_encoding(""), LookupError);
    CHECK_THROWS_AS(canonical_encoding_name("   "), LookupError);
}

TEST_CASE("EncodingRegistry: shift-state encodings are rejected") {
    CHECK_THROWS_AS(resolve_encoding("ISO-2022-JP"), LookupError);
    CHECK_THROWS_AS(resolve_encoding("UTF-7"), LookupError);
}

TEST_CASE("EncodingRegistry: families and sequence lengths") {
    EncodingInfo utf8 = resolve_encoding("utf-8");
    CHECK(utf8.family == EncodingFamily::utf8);
    CHECK(utf8.max_sequence_length == 4);
    CHECK(utf8.ascii_compatible());

    EncodingInfo latin1 = resolve_encoding("iso-8859-1");
    CHECK(latin1.family == EncodingFamily::single_byte);
    CHECK(latin1.max_sequence_length == 1);
    CHECK_FALSE(latin1.unicode());

    EncodingInfo cp1252 = resolve_encoding("windows-1252");
    CHECK(cp1252.family == EncodingFamily::single_byte);

    EncodingInfo sjis = resolve_encoding("shift_jis");
    CHECK(sjis.family == EncodingFamily::multi_byte);
    CHECK(sjis.max_sequence_length >= 2);

    EncodingInfo utf16le = resolve_encoding("utf-16le");
    CHECK(utf16le.family == EncodingFamily::utf16);
    CHECK(utf16le.byte_order == ByteOrder::little);
    CHECK_FALSE(utf16le.bom_sensing());
    CHECK_FALSE(utf16le.ascii_compatible());
}

TEST_CASE("EncodingRegistry: generic UTF-16/32 take their byte order from a BOM") {
    EncodingInfo utf16 = resolve_encoding("utf-16");
    CHECK(utf16.bom_sensing());
    CHECK(with_byte_order(utf16, ByteOrder::little).name == "utf-16le");
    CHECK(with_byte_order(utf16, ByteOrder::big).name == "utf-16be");

    EncodingInfo utf32 = resolve_encoding("utf-32");
    CHECK(utf32.bom_sensing());
    CHECK(with_byte_order(utf32, ByteOrder::little).name == "utf-32le");

    EncodingInfo utf8 = resolve_encoding("utf-8");
    CHECK(with_byte_order(utf8, ByteOrder::little).name == "utf-8");
}
