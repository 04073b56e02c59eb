#pragma once

#include <transcode/encoding.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace transcode::detail {

struct NewlineCounts {
    std::size_t lf = 0;
    std::size_t crlf = 0;
    std::size_t cr = 0;

    std::size_t total() const { return lf + crlf + cr; }
    // CRLF if any CRLF was seen, else LF, else CR; LF when there were none.
    NewlineStyle dominant() const;
    bool mixed() const;
};

class NewlineNormalizer {
public:
    explicit NewlineNormalizer(NewlineStyle target);

    // Rewrite every \n, \r\n and \r in text to the target terminator. A
    // trailing \r is held back in pending_cr until the next chunk shows
    // whether a \n follows it.
    std::string normalize_chunk(std::string_view text, bool& pending_cr);

    // End of input: emit a held-back \r as a lone CR terminator.
    std::string flush(bool& pending_cr);

    const NewlineCounts& counts() const { return counts_; }
    NewlineStyle target() const { return target_; }

private:
    NewlineStyle target_;
    std::string_view terminator_;
    NewlineCounts counts_;
};

} // namespace transcode::detail
