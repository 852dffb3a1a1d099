#pragma once

#include <disambig/core/types.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace disambig::disambiguation {

/**
 * Opaque external ids of persisted records, formatted "TTXXXX-XXXX-XXXX" (upper-case hex).
 * TT is the content type id; the remaining 48 bits are the primary key scrambled by an odd
 * multiplier.
 */
class IdObfuscator {
public:
    struct Decoded {
        int contentTypeId = 0;
        std::int64_t pk = 0;
    };

    static constexpr std::int64_t kMaxPk = (std::int64_t{1} << 48) - 1;

    // InvalidArgument when contentTypeId does not fit one byte or pk is outside [0, kMaxPk]
    static Result<std::string> encode(int contentTypeId, std::int64_t pk);

    // InvalidArgument for anything not produced by encode
    static Result<Decoded> decode(std::string_view id);
};

} // namespace disambig::disambiguation
