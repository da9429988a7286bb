// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/media/playlist_parser.hpp>
#include <stitch/core/log.hpp>
#include <stitch/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <map>
#include <regex>
#include <vector>

namespace stitch::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_MEDIA_SEQUENCE = "#EXT-X-MEDIA-SEQUENCE:";
constexpr std::string_view TAG_BYTERANGE = "#EXT-X-BYTERANGE:";
constexpr std::string_view TAG_KEY = "#EXT-X-KEY:";

using Resolver = std::function<std::optional<std::string>(std::string_view)>;

// Raw EXT-X-KEY attributes, before validation
struct KeyAttributes {
    std::string method;
    std::optional<std::string> uri;
    std::optional<std::string> iv;
    std::string keyformat;
    std::string keyformatversions;
};

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos <= content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        lines.push_back(trim(content.substr(pos, end - pos)));
        pos = end + 1;
    }
    return lines;
}

template<typename T>
bool parse_number(std::string_view text, T& out) noexcept {
    text = trim(text);
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// EXT-X-BYTERANGE value "<length>[@<offset>]". Without an offset the range
// starts where the previous one ended.
std::optional<ByteRange> parse_byterange(std::string_view text, std::uint64_t next_offset) noexcept {
    ByteRange range;
    auto at = text.find('@');
    if (!parse_number(text.substr(0, at), range.length)) {
        return std::nullopt;
    }
    if (at == std::string_view::npos) {
        range.offset = next_offset;
    } else if (!parse_number(text.substr(at + 1), range.offset)) {
        return std::nullopt;
    }
    return range;
}

// Validate key attributes and merge them into the manifest. A second key
// that differs from the first is key rotation, which is not supported.
std::error_code apply_key(const KeyAttributes& attrs, SegmentManifest& manifest,
                          const Resolver& resolve) {
    if (attrs.method == "NONE") {
        return {};
    }
    if (attrs.method != "AES-128") {
        return make_error_code(ParseErrc::unsupported_encryption);
    }
    if (!attrs.uri || attrs.uri->empty()) {
        return make_error_code(ParseErrc::unsupported_encryption);
    }

    EncryptionDescriptor desc;
    desc.method = EncryptionMethod::aes_128;

    auto key_uri = resolve(*attrs.uri);
    if (!key_uri) {
        return make_error_code(ParseErrc::unresolvable_uri);
    }
    desc.key_uri = std::move(*key_uri);

    if (attrs.iv) {
        desc.iv = parse_iv(*attrs.iv);
        if (!desc.iv) {
            return make_error_code(ParseErrc::unsupported_encryption);
        }
    }
    desc.keyformat = attrs.keyformat;
    desc.keyformatversions = attrs.keyformatversions;

    if (manifest.encryption) {
        if (manifest.encryption->key_uri != desc.key_uri || manifest.encryption->iv != desc.iv) {
            return make_error_code(ParseErrc::unsupported_encryption);
        }
        return {};
    }
    manifest.encryption = std::move(desc);
    return {};
}

// Attribute list: NAME=VALUE pairs separated by commas, VALUE optionally a
// quoted string that may itself contain commas
std::optional<std::map<std::string, std::string>> parse_attribute_list(std::string_view text) {
    std::map<std::string, std::string> attrs;
    std::size_t pos = 0;

    while (pos < text.size()) {
        auto eq = text.find('=', pos);
        if (eq == std::string_view::npos) return std::nullopt;

        auto name = trim(text.substr(pos, eq - pos));
        if (name.empty()) return std::nullopt;

        std::size_t value_start = eq + 1;
        std::string value;
        if (value_start < text.size() && text[value_start] == '"') {
            auto close = text.find('"', value_start + 1);
            if (close == std::string_view::npos) return std::nullopt;
            value = std::string(text.substr(value_start + 1, close - value_start - 1));
            pos = close + 1;
            while (pos < text.size() && text[pos] == ' ') ++pos;
            if (pos < text.size()) {
                if (text[pos] != ',') return std::nullopt;
                ++pos;
            }
        } else {
            auto comma = text.find(',', value_start);
            if (comma == std::string_view::npos) comma = text.size();
            value = std::string(trim(text.substr(value_start, comma - value_start)));
            pos = comma == text.size() ? comma : comma + 1;
        }
        attrs[std::string(name)] = std::move(value);
    }
    return attrs;
}

std::optional<std::string> lookup(const std::map<std::string, std::string>& attrs, const char* name) {
    auto it = attrs.find(name);
    if (it == attrs.end()) return std::nullopt;
    return it->second;
}

// Remove "." and ".." segments from an absolute path with a segment stack
std::string normalize_path(std::string_view path) {
    std::vector<std::string_view> stack;
    bool trailing_slash = false;

    std::size_t pos = 1;  // Skip the leading '/'
    while (pos <= path.size()) {
        auto end = path.find('/', pos);
        if (end == std::string_view::npos) end = path.size();
        auto seg = path.substr(pos, end - pos);
        bool last = end == path.size();

        if (seg == ".") {
            trailing_slash = last;
        } else if (seg == "..") {
            if (!stack.empty()) stack.pop_back();
            trailing_slash = last;
        } else {
            stack.push_back(seg);
            trailing_slash = false;
        }
        pos = end + 1;
    }

    std::string out = "/";
    for (std::size_t i = 0; i < stack.size(); ++i) {
        if (i > 0) out += '/';
        out.append(stack[i]);
    }
    if (trailing_slash && out.back() != '/') out += '/';
    return out;
}

bool is_absolute_reference(std::string_view ref) noexcept {
    auto sep = ref.find("://");
    if (sep == std::string_view::npos || sep == 0) return false;
    if (!std::isalpha(static_cast<unsigned char>(ref[0]))) return false;
    for (std::size_t i = 1; i < sep; ++i) {
        auto c = static_cast<unsigned char>(ref[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    auto host_end = ref.find_first_of("/?#", sep + 3);
    if (host_end == std::string_view::npos) host_end = ref.size();
    return host_end > sep + 3;
}

} // namespace

//=============================================================================
// Manual reference resolution
//=============================================================================

std::optional<std::string> resolve_reference(std::string_view base, std::string_view reference) {
    if (is_absolute_reference(reference)) {
        return std::string(reference);
    }
    if (!is_absolute_reference(base)) {
        return std::nullopt;
    }

    auto sep = base.find("://");
    std::string scheme;
    for (std::size_t i = 0; i < sep; ++i) {
        scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(base[i])));
    }

    if (reference.starts_with("//")) {
        if (!is_absolute_reference(scheme + ":" + std::string(reference))) return std::nullopt;
        return scheme + ":" + std::string(reference);
    }

    auto authority_end = base.find_first_of("/?#", sep + 3);
    if (authority_end == std::string_view::npos) authority_end = base.size();
    auto authority = base.substr(sep + 3, authority_end - sep - 3);

    auto rest = base.substr(authority_end);
    auto base_hash = rest.find('#');
    if (base_hash != std::string_view::npos) rest = rest.substr(0, base_hash);
    std::string_view base_path = rest;
    std::optional<std::string_view> base_query;
    auto base_q = rest.find('?');
    if (base_q != std::string_view::npos) {
        base_path = rest.substr(0, base_q);
        base_query = rest.substr(base_q + 1);
    }
    std::string dir = base_path.empty() ? std::string("/") : std::string(base_path);

    std::string_view ref_path = reference;
    std::optional<std::string_view> ref_query;
    std::optional<std::string_view> ref_fragment;
    auto hash = ref_path.find('#');
    if (hash != std::string_view::npos) {
        ref_fragment = ref_path.substr(hash + 1);
        ref_path = ref_path.substr(0, hash);
    }
    auto q = ref_path.find('?');
    if (q != std::string_view::npos) {
        ref_query = ref_path.substr(q + 1);
        ref_path = ref_path.substr(0, q);
    }

    std::string path;
    std::optional<std::string_view> query = ref_query;
    if (ref_path.empty()) {
        path = dir;
        if (!ref_query) query = base_query;
    } else if (ref_path.front() == '/') {
        path = normalize_path(ref_path);
    } else {
        path = normalize_path(dir.substr(0, dir.rfind('/') + 1) + std::string(ref_path));
    }

    std::string out = scheme + "://" + std::string(authority) + path;
    if (query) {
        out += '?';
        out.append(*query);
    }
    if (ref_fragment) {
        out += '#';
        out.append(*ref_fragment);
    }
    return out;
}

//=============================================================================
// PlaylistParser
//=============================================================================

bool PlaylistParser::is_hls_url(std::string_view url) noexcept {
    std::string lower_url;
    lower_url.reserve(url.size());
    for (char c : url) {
        lower_url += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower_url.find(".m3u8") != std::string::npos;
}

std::expected<SegmentManifest, std::error_code>
PlaylistParser::parse(std::string_view content, std::string_view base_url) noexcept {
    auto structured = parse_structured(content, base_url);
    if (structured) {
        return structured;
    }

    core::logger()->debug("Structured playlist parse failed ({}), using line scan",
                          structured.error().message());
    return parse_lines(content, base_url);
}

std::expected<SegmentManifest, std::error_code>
PlaylistParser::parse_structured(std::string_view content, std::string_view base_url) noexcept {
    try {
        auto base = core::Url::parse(base_url);
        if (!base) {
            return std::unexpected(make_error_code(ParseErrc::unresolvable_uri));
        }
        Resolver resolve = [&](std::string_view ref) -> std::optional<std::string> {
            auto url = base->resolve(ref);
            if (!url) return std::nullopt;
            return url->str();
        };

        SegmentManifest manifest;
        manifest.source_url = std::string(base_url);

        auto lines = split_lines(content);
        auto first = std::find_if(lines.begin(), lines.end(),
                                  [](std::string_view l) { return !l.empty(); });
        if (first == lines.end()) {
            return std::unexpected(make_error_code(ParseErrc::empty));
        }
        // Tolerate a UTF-8 byte order mark
        auto header = *first;
        if (header.starts_with("\xEF\xBB\xBF")) header.remove_prefix(3);
        if (header != TAG_HEADER) {
            return std::unexpected(make_error_code(ParseErrc::malformed));
        }

        bool pending_extinf = false;
        std::optional<ByteRange> pending_range;
        std::uint64_t next_range_offset = 0;

        for (auto it = std::next(first); it != lines.end(); ++it) {
            auto line = *it;
            if (line.empty()) continue;

            if (line.starts_with(TAG_EXTINF)) {
                auto val = line.substr(TAG_EXTINF.size());
                auto comma = val.find(',');
                if (comma != std::string_view::npos) val = val.substr(0, comma);
                double duration = 0.0;
                if (!parse_number(val, duration) || duration < 0.0) {
                    return std::unexpected(make_error_code(ParseErrc::malformed));
                }
                pending_extinf = true;
            } else if (line.starts_with(TAG_BYTERANGE)) {
                pending_range = parse_byterange(line.substr(TAG_BYTERANGE.size()), next_range_offset);
                if (!pending_range) {
                    return std::unexpected(make_error_code(ParseErrc::malformed));
                }
            } else if (line.starts_with(TAG_MEDIA_SEQUENCE)) {
                if (!parse_number(line.substr(TAG_MEDIA_SEQUENCE.size()), manifest.media_sequence)) {
                    return std::unexpected(make_error_code(ParseErrc::malformed));
                }
            } else if (line.starts_with(TAG_KEY)) {
                auto attrs = parse_attribute_list(line.substr(TAG_KEY.size()));
                if (!attrs) {
                    return std::unexpected(make_error_code(ParseErrc::malformed));
                }
                auto method = lookup(*attrs, "METHOD");
                if (!method) {
                    return std::unexpected(make_error_code(ParseErrc::malformed));
                }
                KeyAttributes key;
                key.method = *method;
                key.uri = lookup(*attrs, "URI");
                key.iv = lookup(*attrs, "IV");
                key.keyformat = lookup(*attrs, "KEYFORMAT").value_or("");
                key.keyformatversions = lookup(*attrs, "KEYFORMATVERSIONS").value_or("");
                if (auto ec = apply_key(key, manifest, resolve)) {
                    return std::unexpected(ec);
                }
            } else if (line.front() == '#') {
                continue;  // Other tags and comments
            } else {
                if (!pending_extinf) {
                    return std::unexpected(make_error_code(ParseErrc::malformed));
                }
                auto uri = resolve(line);
                if (!uri) {
                    return std::unexpected(make_error_code(ParseErrc::unresolvable_uri));
                }

                SegmentRef seg;
                seg.index = static_cast<std::uint32_t>(manifest.segments.size());
                seg.uri = std::move(*uri);
                seg.byte_range = pending_range;
                if (pending_range) {
                    next_range_offset = pending_range->offset + pending_range->length;
                }
                manifest.segments.push_back(std::move(seg));

                pending_extinf = false;
                pending_range.reset();
            }
        }

        if (manifest.segments.empty()) {
            return std::unexpected(make_error_code(ParseErrc::empty));
        }
        return manifest;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ParseErrc::malformed));
    }
}

std::expected<SegmentManifest, std::error_code>
PlaylistParser::parse_lines(std::string_view content, std::string_view base_url) noexcept {
    try {
        static const std::regex method_regex(R"(METHOD=([^,\s]+))");
        static const std::regex uri_regex(R"re(URI="([^"]*)")re");
        static const std::regex iv_regex(R"(IV=(0[xX][0-9A-Fa-f]+))");
        static const std::regex keyformat_regex(R"re(KEYFORMAT="([^"]*)")re");
        static const std::regex keyformatversions_regex(R"re(KEYFORMATVERSIONS="([^"]*)")re");
        static const std::regex sequence_regex(R"(^#EXT-X-MEDIA-SEQUENCE:\s*(\d+))");

        Resolver resolve = [&](std::string_view ref) {
            return resolve_reference(base_url, ref);
        };

        SegmentManifest manifest;
        manifest.source_url = std::string(base_url);

        std::optional<ByteRange> pending_range;
        std::uint64_t next_range_offset = 0;

        for (auto line : split_lines(content)) {
            if (line.empty()) continue;

            if (line.front() != '#') {
                auto uri = resolve(line);
                if (!uri) {
                    return std::unexpected(make_error_code(ParseErrc::unresolvable_uri));
                }
                SegmentRef seg;
                seg.index = static_cast<std::uint32_t>(manifest.segments.size());
                seg.uri = std::move(*uri);
                seg.byte_range = pending_range;
                if (pending_range) {
                    next_range_offset = pending_range->offset + pending_range->length;
                }
                manifest.segments.push_back(std::move(seg));
                pending_range.reset();
                continue;
            }

            if (line.starts_with(TAG_BYTERANGE)) {
                pending_range = parse_byterange(line.substr(TAG_BYTERANGE.size()), next_range_offset);
                if (!pending_range) {
                    core::logger()->debug("Ignoring malformed byte range '{}'", line);
                }
                continue;
            }

            std::string text(line);
            std::smatch match;

            if (line.starts_with(TAG_KEY)) {
                KeyAttributes key;
                // KEYFORMAT= is a prefix of KEYFORMATVERSIONS=, take the latter out first
                if (std::regex_search(text, match, keyformatversions_regex)) {
                    key.keyformatversions = match[1].str();
                    text = match.prefix().str() + match.suffix().str();
                }
                if (std::regex_search(text, match, method_regex)) key.method = match[1].str();
                if (std::regex_search(text, match, uri_regex)) key.uri = match[1].str();
                if (std::regex_search(text, match, iv_regex)) key.iv = match[1].str();
                if (std::regex_search(text, match, keyformat_regex)) key.keyformat = match[1].str();

                if (auto ec = apply_key(key, manifest, resolve)) {
                    return std::unexpected(ec);
                }
            } else if (std::regex_search(text, match, sequence_regex)) {
                if (!parse_number(std::string_view(match[1].str()), manifest.media_sequence)) {
                    manifest.media_sequence = 0;
                }
            }
        }

        if (manifest.segments.empty()) {
            return std::unexpected(make_error_code(ParseErrc::empty));
        }
        return manifest;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ParseErrc::malformed));
    }
}

} // namespace stitch::media
