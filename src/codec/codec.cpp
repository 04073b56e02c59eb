#include "codec.h"

#include <transcode/error.h>

#include <unicode/ucnv_cb.h>
#include <unicode/ucnv_err.h>
#include <unicode/ustring.h>
#include <unicode/utf16.h>
#include <unicode/utypes.h>

#include <algorithm>
#include <vector>

namespace transcode::detail {

namespace {

constexpr std::size_t kUnitBufferSize = 4096;
constexpr std::size_t kByteBufferSize = 8192;

struct Counters {
    std::size_t replacements = 0;
    std::size_t invalid_bytes = 0;
};

bool is_error_reason(UConverterCallbackReason reason) {
    return reason == UCNV_UNASSIGNED || reason == UCNV_ILLEGAL || reason == UCNV_IRREGULAR;
}

void U_CALLCONV count_to_unicode(const void* context, UConverterToUnicodeArgs* args,
                                 const char* /*code_units*/, int32_t length,
                                 UConverterCallbackReason reason, UErrorCode* err) {
    if (!is_error_reason(reason)) return;
    auto* counters = static_cast<Counters*>(const_cast<void*>(context));
    ++counters->replacements;
    counters->invalid_bytes += static_cast<std::size_t>(length);

    // Always U+FFFD; ICU's own substitute turns single bytes of some
    // tables into U+001A.
    static const UChar replacement = 0xFFFD;
    *err = U_ZERO_ERROR;
    ucnv_cbToUWriteUChars(args, &replacement, 1, 0, err);
}

void U_CALLCONV count_from_unicode(const void* context, UConverterFromUnicodeArgs* args,
                                   const UChar* code_units, int32_t length, UChar32 code_point,
                                   UConverterCallbackReason reason, UErrorCode* err) {
    if (is_error_reason(reason)) {
        auto* counters = static_cast<Counters*>(const_cast<void*>(context));
        ++counters->replacements;
    }
    UCNV_FROM_U_CALLBACK_SUBSTITUTE(nullptr, args, code_units, length, code_point, reason, err);
}

void check(UErrorCode err, const char* what, const EncodingInfo& encoding) {
    if (U_FAILURE(err)) {
        throw ConversionError(std::string(what) + " failed for " + encoding.name + ": " +
                              u_errorName(err));
    }
}

void append_utf8(const UChar* units, std::size_t count, std::string& out,
                 const EncodingInfo& encoding) {
    if (count == 0) return;
    // At most 3 UTF-8 bytes per UTF-16 unit.
    const std::size_t offset = out.size();
    out.resize(offset + count * 3);
    int32_t length = 0;
    UErrorCode err = U_ZERO_ERROR;
    u_strToUTF8WithSub(out.data() + offset, static_cast<int32_t>(count * 3), &length, units,
                       static_cast<int32_t>(count), 0xFFFD, nullptr, &err);
    check(err, "UTF-16 to UTF-8", encoding);
    out.resize(offset + static_cast<std::size_t>(length));
}

class IcuDecoder : public Decoder {
public:
    explicit IcuDecoder(const EncodingInfo& encoding)
        : encoding_(encoding)
        , converter_(open_converter(encoding.icu_name))
        , units_(kUnitBufferSize)
    {
        UErrorCode err = U_ZERO_ERROR;
        ucnv_setToUCallBack(converter_.get(), count_to_unicode, &counters_, nullptr, nullptr,
                            &err);
        check(err, "installing decode callback", encoding_);
    }

    IcuDecoder(const IcuDecoder&) = delete;
    IcuDecoder& operator=(const IcuDecoder&) = delete;

    DecodeResult decode(std::string_view input, bool is_last, std::string& out) override {
        const Counters before = counters_;
        const char* src = input.data();
        const char* src_limit = src + input.size();

        std::size_t held = 0;  // lead surrogate kept back from a full buffer
        UErrorCode err = U_ZERO_ERROR;
        do {
            err = U_ZERO_ERROR;
            UChar* target = units_.data() + held;
            UChar* target_limit = units_.data() + units_.size();
            ucnv_toUnicode(converter_.get(), &target, target_limit, &src, src_limit, nullptr,
                           is_last, &err);

            auto produced = static_cast<std::size_t>(target - units_.data());
            held = 0;
            if (err == U_BUFFER_OVERFLOW_ERROR && produced > 0 &&
                U16_IS_LEAD(units_[produced - 1])) {
                held = 1;
                --produced;
            }
            append_utf8(units_.data(), produced, out, encoding_);
            if (held) units_[0] = units_[produced];
        } while (err == U_BUFFER_OVERFLOW_ERROR);
        check(err, "decoding", encoding_);

        DecodeResult result;
        result.consumed = input.size();
        if (!is_last) {
            UErrorCode pending_err = U_ZERO_ERROR;
            int32_t pending = ucnv_toUCountPending(converter_.get(), &pending_err);
            check(pending_err, "counting pending bytes", encoding_);
            if (pending > 0) {
                // The converter buffered the start of an incomplete sequence.
                // Hand it back to the caller so the carry lives in ChunkState.
                if (static_cast<std::size_t>(pending) > input.size()) {
                    throw ConversionError("decoder for " + encoding_.name +
                                          " holds bytes from an earlier chunk");
                }
                result.consumed -= static_cast<std::size_t>(pending);
                ucnv_resetToUnicode(converter_.get());
            }
        }
        result.replacements = counters_.replacements - before.replacements;
        result.invalid_bytes = counters_.invalid_bytes - before.invalid_bytes;
        return result;
    }

    const EncodingInfo& encoding() const override { return encoding_; }

private:
    EncodingInfo encoding_;
    ConverterPtr converter_;
    std::vector<UChar> units_;
    Counters counters_;
};

class IcuEncoder : public Encoder {
public:
    explicit IcuEncoder(const EncodingInfo& encoding)
        : encoding_(encoding)
        , converter_(open_converter(encoding.icu_name))
        , bytes_(kByteBufferSize)
    {
        UErrorCode err = U_ZERO_ERROR;
        ucnv_setFromUCallBack(converter_.get(), count_from_unicode, &counters_, nullptr, nullptr,
                              &err);
        check(err, "installing encode callback", encoding_);
        if (!encoding_.unicode()) {
            ucnv_setSubstChars(converter_.get(), "?", 1, &err);
            check(err, "setting substitution character", encoding_);
        }
    }

    IcuEncoder(const IcuEncoder&) = delete;
    IcuEncoder& operator=(const IcuEncoder&) = delete;

    std::size_t encode(std::string_view utf8, bool is_last, std::string& out) override {
        const std::size_t before = counters_.replacements;

        // A UTF-8 string never needs more UTF-16 units than it has bytes.
        units_.resize(std::max<std::size_t>(utf8.size(), 1));
        int32_t unit_count = 0;
        if (!utf8.empty()) {
            UErrorCode err = U_ZERO_ERROR;
            u_strFromUTF8WithSub(units_.data(), static_cast<int32_t>(units_.size()), &unit_count,
                                 utf8.data(), static_cast<int32_t>(utf8.size()), 0xFFFD, nullptr,
                                 &err);
            check(err, "UTF-8 to UTF-16", encoding_);
        }

        const UChar* src = units_.data();
        const UChar* src_limit = src + unit_count;
        UErrorCode err = U_ZERO_ERROR;
        do {
            err = U_ZERO_ERROR;
            char* target = bytes_.data();
            char* target_limit = bytes_.data() + bytes_.size();
            ucnv_fromUnicode(converter_.get(), &target, target_limit, &src, src_limit, nullptr,
                             is_last, &err);
            out.append(bytes_.data(), static_cast<std::size_t>(target - bytes_.data()));
        } while (err == U_BUFFER_OVERFLOW_ERROR);
        check(err, "encoding", encoding_);

        return counters_.replacements - before;
    }

    const EncodingInfo& encoding() const override { return encoding_; }

private:
    EncodingInfo encoding_;
    ConverterPtr converter_;
    std::vector<UChar> units_;
    std::vector<char> bytes_;
    Counters counters_;
};

} // namespace

std::unique_ptr<Decoder> make_decoder(const EncodingInfo& encoding) {
    if (encoding.bom_sensing()) {
        return std::make_unique<IcuDecoder>(with_byte_order(encoding, ByteOrder::big));
    }
    return std::make_unique<IcuDecoder>(encoding);
}

std::unique_ptr<Encoder> make_encoder(const EncodingInfo& encoding) {
    return std::make_unique<IcuEncoder>(encoding);
}

} // namespace transcode::detail
