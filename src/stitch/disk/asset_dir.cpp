// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/disk/asset_dir.hpp>
#include <stitch/disk/atomic_file.hpp>
#include <stitch/core/config.hpp>
#include <stitch/core/error.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace stitch::disk {

using nlohmann::json;

namespace {

constexpr std::string_view INVALID_NAME_CHARS = "<>:\"/\\|?*";
constexpr std::size_t SEGMENT_INDEX_WIDTH = 5;

std::error_code save_json(const std::filesystem::path& path, const json& doc) noexcept {
    try {
        return write_file_atomic(path, doc.dump(2));
    } catch (const json::exception&) {
        return make_error_code(DiskErrc::corrupt_data);
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::expected<json, std::error_code> load_json(const std::filesystem::path& path) noexcept {
    auto text = read_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    try {
        return json::parse(*text);
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(DiskErrc::corrupt_data));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

json nullable(const std::string& s) {
    return s.empty() ? json(nullptr) : json(s);
}

std::string string_or_empty(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return {};
    return it->get<std::string>();
}

} // namespace

std::expected<std::string, std::error_code> sanitize_identifier(std::string_view identifier) noexcept {
    while (!identifier.empty() && std::isspace(static_cast<unsigned char>(identifier.front()))) {
        identifier.remove_prefix(1);
    }
    while (!identifier.empty() && std::isspace(static_cast<unsigned char>(identifier.back()))) {
        identifier.remove_suffix(1);
    }
    if (identifier.empty()) {
        return std::unexpected(make_error_code(core::ConfigErrc::invalid_identifier));
    }

    try {
        std::string name(identifier);
        std::replace_if(name.begin(), name.end(),
                        [](char c) { return INVALID_NAME_CHARS.find(c) != std::string_view::npos; },
                        '_');
        // "." and ".." would escape or alias the root
        if (name == "." || name == "..") {
            return std::unexpected(make_error_code(core::ConfigErrc::invalid_identifier));
        }
        return name;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(core::ConfigErrc::invalid_identifier));
    }
}

//=============================================================================
// AssetDir
//=============================================================================

std::expected<AssetDir, std::error_code>
AssetDir::open(const std::filesystem::path& root, std::string_view identifier) noexcept {
    auto name = sanitize_identifier(identifier);
    if (!name) {
        return std::unexpected(name.error());
    }
    try {
        AssetDir dir;
        dir.name_ = std::move(*name);
        dir.path_ = root / dir.name_;
        return dir;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
}

std::error_code AssetDir::create() const noexcept {
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        return make_error_code(DiskErrc::access_denied);
    }
    return {};
}

std::filesystem::path AssetDir::playlist_path() const { return path_ / PLAYLIST_FILE; }
std::filesystem::path AssetDir::manifest_path() const { return path_ / MANIFEST_FILE; }
std::filesystem::path AssetDir::encryption_info_path() const { return path_ / ENCRYPTION_INFO_FILE; }
std::filesystem::path AssetDir::key_path() const { return path_ / KEY_FILE; }
std::filesystem::path AssetDir::content_lengths_path() const { return path_ / CONTENT_LENGTHS_FILE; }

std::filesystem::path AssetDir::segment_path(std::uint32_t index) const {
    return path_ / segment_filename(index);
}

std::string AssetDir::segment_filename(std::uint32_t index) {
    auto digits = std::to_string(index);
    if (digits.size() < SEGMENT_INDEX_WIDTH) {
        digits.insert(0, SEGMENT_INDEX_WIDTH - digits.size(), '0');
    }
    return "segment_" + digits + ".ts";
}

std::error_code AssetDir::save_playlist(std::string_view text) const noexcept {
    if (auto ec = create()) return ec;
    try {
        return write_file_atomic(playlist_path(), text);
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::expected<std::string, std::error_code> AssetDir::load_playlist() const noexcept {
    try {
        return read_file(playlist_path());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::error_code AssetDir::save_manifest(const media::SegmentManifest& manifest) const noexcept {
    if (auto ec = create()) return ec;
    try {
        json segments = json::array();
        for (const auto& seg : manifest.segments) {
            json entry = {
                {"index", seg.index},
                {"uri", seg.uri},
                {"byte_range", nullptr},
            };
            if (seg.byte_range) {
                entry["byte_range"] = {
                    {"offset", seg.byte_range->offset},
                    {"length", seg.byte_range->length},
                };
            }
            segments.push_back(std::move(entry));
        }

        json doc = {
            {"source_url", manifest.source_url},
            {"media_sequence", manifest.media_sequence},
            {"segments", std::move(segments)},
        };
        return save_json(manifest_path(), doc);
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::expected<media::SegmentManifest, std::error_code> AssetDir::load_manifest() const noexcept {
    auto doc = load_json(manifest_path());
    if (!doc) {
        return std::unexpected(doc.error());
    }

    try {
        media::SegmentManifest manifest;
        manifest.source_url = doc->at("source_url").get<std::string>();
        manifest.media_sequence = doc->value("media_sequence", std::uint64_t{0});

        const auto& segments = doc->at("segments");
        if (!segments.is_array()) {
            return std::unexpected(make_error_code(DiskErrc::corrupt_data));
        }
        for (const auto& entry : segments) {
            media::SegmentRef seg;
            seg.index = entry.at("index").get<std::uint32_t>();
            seg.uri = entry.at("uri").get<std::string>();

            auto range = entry.find("byte_range");
            if (range != entry.end() && !range->is_null()) {
                seg.byte_range = media::ByteRange{
                    range->at("offset").get<std::uint64_t>(),
                    range->at("length").get<std::uint64_t>(),
                };
            }
            // Indices are contiguous from zero in manifest order
            if (seg.index != manifest.segments.size()) {
                return std::unexpected(make_error_code(DiskErrc::corrupt_data));
            }
            manifest.segments.push_back(std::move(seg));
        }
        return manifest;
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(DiskErrc::corrupt_data));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::error_code
AssetDir::save_encryption_info(const std::optional<media::EncryptionDescriptor>& desc) const noexcept {
    if (auto ec = create()) return ec;
    try {
        bool encrypted = desc && desc->method != media::EncryptionMethod::none;

        json doc = {
            {"is_encrypted", encrypted},
            {"method", encrypted ? json(std::string(media::to_string(desc->method))) : json(nullptr)},
            {"key_uri", encrypted ? json(desc->key_uri) : json(nullptr)},
            {"key_file", encrypted ? json(std::string(KEY_FILE)) : json(nullptr)},
            {"iv", encrypted && desc->iv ? json(media::format_iv(*desc->iv)) : json(nullptr)},
            {"keyformat", encrypted ? nullable(desc->keyformat) : json(nullptr)},
            {"keyformatversions", encrypted ? nullable(desc->keyformatversions) : json(nullptr)},
        };
        return save_json(encryption_info_path(), doc);
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::expected<std::optional<media::EncryptionDescriptor>, std::error_code>
AssetDir::load_encryption_info() const noexcept {
    auto doc = load_json(encryption_info_path());
    if (!doc) {
        return std::unexpected(doc.error());
    }

    try {
        if (!doc->at("is_encrypted").get<bool>()) {
            return std::optional<media::EncryptionDescriptor>{};
        }

        media::EncryptionDescriptor desc;
        if (doc->at("method").get<std::string>() != media::to_string(media::EncryptionMethod::aes_128)) {
            return std::unexpected(make_error_code(DiskErrc::corrupt_data));
        }
        desc.method = media::EncryptionMethod::aes_128;
        desc.key_uri = doc->at("key_uri").get<std::string>();

        auto iv = string_or_empty(*doc, "iv");
        if (!iv.empty()) {
            desc.iv = media::parse_iv(iv);
            if (!desc.iv) {
                return std::unexpected(make_error_code(DiskErrc::corrupt_data));
            }
        }
        desc.keyformat = string_or_empty(*doc, "keyformat");
        desc.keyformatversions = string_or_empty(*doc, "keyformatversions");
        return std::optional<media::EncryptionDescriptor>{std::move(desc)};
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(DiskErrc::corrupt_data));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::error_code AssetDir::save_key(std::span<const std::uint8_t> key) const noexcept {
    if (auto ec = create()) return ec;
    try {
        return write_file_atomic(key_path(),
                                 std::string_view(reinterpret_cast<const char*>(key.data()), key.size()));
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::expected<std::vector<std::uint8_t>, std::error_code> AssetDir::load_key() const noexcept {
    try {
        auto text = read_file(key_path());
        if (!text) {
            return std::unexpected(text.error());
        }
        if (text->size() != core::AES_KEY_SIZE) {
            return std::unexpected(make_error_code(DiskErrc::corrupt_data));
        }
        return std::vector<std::uint8_t>(text->begin(), text->end());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::error_code AssetDir::save_content_lengths(const ContentLengths& lengths) const noexcept {
    if (auto ec = create()) return ec;
    try {
        json doc = json::object();
        for (const auto& [index, bytes] : lengths) {
            doc[std::to_string(index)] = bytes;
        }
        return save_json(content_lengths_path(), doc);
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::expected<ContentLengths, std::error_code> AssetDir::load_content_lengths() const noexcept {
    auto doc = load_json(content_lengths_path());
    if (!doc) {
        return std::unexpected(doc.error());
    }

    try {
        if (!doc->is_object()) {
            return std::unexpected(make_error_code(DiskErrc::corrupt_data));
        }
        ContentLengths lengths;
        for (const auto& [key, value] : doc->items()) {
            std::uint32_t index = 0;
            auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), index);
            if (ec != std::errc{} || ptr != key.data() + key.size()) {
                return std::unexpected(make_error_code(DiskErrc::corrupt_data));
            }
            lengths[index] = value.get<std::uint64_t>();
        }
        return lengths;
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(DiskErrc::corrupt_data));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

std::expected<media::SegmentManifest, std::error_code> AssetDir::load_full_manifest() const noexcept {
    auto manifest = load_manifest();
    if (!manifest) {
        return manifest;
    }
    auto encryption = load_encryption_info();
    if (!encryption) {
        return std::unexpected(encryption.error());
    }
    manifest->encryption = std::move(*encryption);
    return manifest;
}

bool AssetDir::has_metadata() const noexcept {
    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(playlist_path(), ec)) {
            return false;
        }
        if (!load_manifest() || !load_content_lengths()) {
            return false;
        }
        auto encryption = load_encryption_info();
        if (!encryption) {
            return false;
        }
        if (*encryption && !load_key()) {
            return false;
        }
        return true;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

} // namespace stitch::disk
