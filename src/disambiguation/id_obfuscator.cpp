#include <disambig/disambiguation/id_obfuscator.h>

#include <spdlog/fmt/fmt.h>

#include <charconv>

namespace disambig::disambiguation {

namespace {

constexpr std::uint64_t kMask = (std::uint64_t{1} << 48) - 1;
constexpr std::uint64_t kMultiplier = 0x5DEECE66DULL;

// Inverse of an odd number modulo 2^64 (and so modulo 2^48) by Newton iteration
constexpr std::uint64_t modularInverse(std::uint64_t a) {
    std::uint64_t x = a;
    for (int i = 0; i < 6; ++i) {
        x *= 2 - a * x;
    }
    return x;
}

constexpr std::uint64_t kInverse = modularInverse(kMultiplier);
static_assert(((kMultiplier * kInverse) & kMask) == 1);

bool parseHex(std::string_view text, std::uint64_t& out) {
    for (char c : text) {
        const bool hex = (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out, 16);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

Result<std::string> IdObfuscator::encode(int contentTypeId, std::int64_t pk) {
    if (contentTypeId < 0 || contentTypeId > 0xFF) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("content type id {} out of range", contentTypeId)};
    }
    if (pk < 0 || pk > kMaxPk) {
        return Error{ErrorCode::InvalidArgument, fmt::format("primary key {} out of range", pk)};
    }
    const auto scrambled = (static_cast<std::uint64_t>(pk) * kMultiplier) & kMask;
    const auto hex = fmt::format("{:012X}", scrambled);
    return fmt::format("{:02X}{}-{}-{}", contentTypeId, hex.substr(0, 4), hex.substr(4, 4),
                       hex.substr(8, 4));
}

Result<IdObfuscator::Decoded> IdObfuscator::decode(std::string_view id) {
    auto invalid = [&]() {
        return Error{ErrorCode::InvalidArgument, "malformed id: " + std::string(id)};
    };
    if (id.size() != 16 || id[6] != '-' || id[11] != '-') {
        return invalid();
    }

    std::uint64_t type = 0;
    if (!parseHex(id.substr(0, 2), type)) {
        return invalid();
    }
    std::string body;
    body.reserve(12);
    body.append(id.substr(2, 4)).append(id.substr(7, 4)).append(id.substr(12, 4));
    std::uint64_t scrambled = 0;
    if (!parseHex(body, scrambled)) {
        return invalid();
    }

    Decoded out;
    out.contentTypeId = static_cast<int>(type);
    out.pk = static_cast<std::int64_t>((scrambled * kInverse) & kMask);
    return out;
}

} // namespace disambig::disambiguation
