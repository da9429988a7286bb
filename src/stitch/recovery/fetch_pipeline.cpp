// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/recovery/fetch_pipeline.hpp>
#include <stitch/core/log.hpp>
#include <stitch/disk/atomic_file.hpp>
#include <stitch/media/aes_decryptor.hpp>
#include <stitch/media/playlist_parser.hpp>
#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>

namespace stitch::recovery {

using core::FetchErrc;
using core::logger;

// Shared by the workers of one segment pass
struct FetchPipeline::PassState {
    std::vector<std::uint8_t> key;          // Empty unless encrypted
    disk::ContentLengths lengths;
    bool lengths_changed{false};
    std::mutex lengths_mutex;
};

const char* to_string(FetchStatus status) noexcept {
    switch (status) {
        case FetchStatus::fetched: return "fetched";
        case FetchStatus::failed:  return "failed";
        case FetchStatus::skipped: return "skipped";
    }
    return "unknown";
}

//=============================================================================
// Throttle
//=============================================================================

bool Throttle::acquire(std::stop_token stop) noexcept {
    if (spacing_.count() <= 0) {
        return !stop.stop_requested();
    }

    std::unique_lock lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto slot = std::max(now, next_);
    next_ = slot + spacing_;

    // Only a stop request wakes the waiter early
    cv_.wait_until(lock, stop, slot, [] { return false; });
    return !stop.stop_requested();
}

//=============================================================================
// Segment pass
//=============================================================================

std::vector<FetchOutcome>
FetchPipeline::fetch(const media::SegmentManifest& manifest,
                     std::span<const media::SegmentRef> subset,
                     const disk::AssetDir& dir,
                     std::stop_token stop) noexcept {
    std::vector<FetchOutcome> outcomes;
    try {
        outcomes.reserve(subset.size());
        for (const auto& ref : subset) {
            outcomes.push_back({ref.index, FetchStatus::failed, 0, make_error_code(FetchErrc::cancelled)});
        }
        if (subset.empty()) {
            return outcomes;
        }
        if (pass_observer_) {
            pass_observer_(subset.size());
        }

        auto fail_all = [&](std::error_code ec) {
            for (auto& outcome : outcomes) {
                outcome.error = ec;
            }
            return outcomes;
        };

        if (auto ec = dir.create()) {
            logger()->error("Cannot create {}: {}", dir.path().string(), ec.message());
            return fail_all(make_error_code(FetchErrc::write_failed));
        }

        PassState state;
        if (manifest.is_encrypted()) {
            auto key = dir.load_key();
            if (!key) {
                logger()->error("Encryption key for {} unavailable: {}", dir.name(), key.error().message());
                return fail_all(make_error_code(FetchErrc::key_unavailable));
            }
            state.key = std::move(*key);
        }

        if (auto lengths = dir.load_content_lengths()) {
            state.lengths = std::move(*lengths);
        } else if (lengths.error() != make_error_code(disk::DiskErrc::file_not_found)) {
            logger()->warn("Ignoring unreadable {} in {}: {}", disk::CONTENT_LENGTHS_FILE,
                           dir.name(), lengths.error().message());
        }

        auto workers_count = std::min<std::size_t>(config_.concurrency, subset.size());
        logger()->info("Fetching {} segment(s) of {} with {} worker(s)",
                       subset.size(), dir.name(), workers_count);

        Throttle throttle(config_.delay());
        std::atomic<std::size_t> next{0};
        std::atomic<std::size_t> finished{0};

        {
            std::vector<std::jthread> workers;
            workers.reserve(workers_count);
            for (std::size_t w = 0; w < workers_count; ++w) {
                workers.emplace_back([&] {
                    while (!stop.stop_requested()) {
                        auto i = next.fetch_add(1, std::memory_order_relaxed);
                        if (i >= subset.size()) {
                            return;
                        }
                        if (!throttle.acquire(stop)) {
                            return;
                        }
                        outcomes[i] = fetch_segment(manifest, subset[i], dir, state);
                        auto done = finished.fetch_add(1, std::memory_order_relaxed) + 1;
                        if (observer_) {
                            observer_(outcomes[i], done, subset.size());
                        }
                    }
                });
            }
        } // jthreads join here

        if (state.lengths_changed) {
            if (auto ec = dir.save_content_lengths(state.lengths)) {
                logger()->warn("Failed to persist {} for {}: {}", disk::CONTENT_LENGTHS_FILE,
                               dir.name(), ec.message());
            }
        }

        std::size_t fetched = 0, skipped = 0, failed = 0;
        for (const auto& outcome : outcomes) {
            switch (outcome.status) {
                case FetchStatus::fetched: ++fetched; break;
                case FetchStatus::skipped: ++skipped; break;
                case FetchStatus::failed:  ++failed; break;
            }
        }
        if (stop.stop_requested()) {
            logger()->warn("Segment pass for {} stopped early", dir.name());
        }
        logger()->info("Segment pass for {} done: {} fetched, {} skipped, {} failed",
                       dir.name(), fetched, skipped, failed);
    } catch (const std::system_error& e) {
        // Thread creation failure; segments never started stay cancelled
        logger()->error("Segment pass for {} aborted: {}", dir.name(), e.what());
    } catch (const std::bad_alloc&) {
        logger()->error("Segment pass for {} aborted: out of memory", dir.name());
    }
    return outcomes;
}

FetchOutcome FetchPipeline::fetch_segment(const media::SegmentManifest& manifest,
                                          const media::SegmentRef& ref,
                                          const disk::AssetDir& dir,
                                          PassState& state) noexcept {
    FetchOutcome outcome{ref.index, FetchStatus::failed, 0, {}};
    auto fail = [&](std::error_code ec) {
        outcome.error = ec;
        logger()->debug("Segment {} of {} failed: {}", ref.index, dir.name(), ec.message());
        return outcome;
    };

    try {
        auto path = dir.segment_path(ref.index);

        std::optional<std::uint64_t> expected;
        {
            std::lock_guard lock(state.lengths_mutex);
            auto it = state.lengths.find(ref.index);
            if (it != state.lengths.end()) expected = it->second;
        }

        std::error_code ec;
        if (expected && std::filesystem::is_regular_file(path, ec)) {
            auto size = std::filesystem::file_size(path, ec);
            if (!ec && size == *expected) {
                outcome.status = FetchStatus::skipped;
                outcome.bytes_written = 0;
                return outcome;
            }
        }

        auto file = disk::AtomicFile::create(path);
        if (!file) {
            return fail(file.error());
        }

        std::optional<media::AesDecryptor> decryptor;
        if (manifest.is_encrypted()) {
            auto dec = media::AesDecryptor::create(state.key, manifest.segment_iv(ref.index));
            if (!dec) {
                return fail(dec.error());
            }
            decryptor.emplace(std::move(*dec));
        }

        std::error_code sink_error;
        std::vector<std::byte> plain;
        core::BodySink sink = [&](const std::byte* data, std::size_t size) {
            if (!decryptor) {
                sink_error = file->write(data, size);
                return !sink_error;
            }
            plain.clear();
            if ((sink_error = decryptor->update({data, size}, plain))) {
                return false;
            }
            sink_error = file->write(plain.data(), plain.size());
            return !sink_error;
        };

        std::uint64_t offset = ref.byte_range ? ref.byte_range->offset : 0;
        std::uint64_t length = ref.byte_range ? ref.byte_range->length : 0;
        auto response = client_.get(ref.uri, sink, offset, length);

        if (sink_error) {
            return fail(sink_error);
        }
        if (!response) {
            return fail(response.error());
        }
        if (response->content_length && *response->content_length != response->body_bytes) {
            return fail(make_error_code(FetchErrc::size_mismatch));
        }

        if (decryptor) {
            plain.clear();
            if (auto dec_ec = decryptor->finish(plain)) {
                return fail(dec_ec);
            }
            if (auto write_ec = file->write(plain.data(), plain.size())) {
                return fail(write_ec);
            }
        }

        if (file->size() == 0) {
            return fail(make_error_code(FetchErrc::empty_response));
        }
        if (expected && file->size() != *expected) {
            return fail(make_error_code(FetchErrc::size_mismatch));
        }

        auto written = file->size();
        if (auto commit_ec = file->commit()) {
            return fail(commit_ec);
        }

        {
            std::lock_guard lock(state.lengths_mutex);
            state.lengths[ref.index] = written;
            state.lengths_changed = true;
        }

        outcome.status = FetchStatus::fetched;
        outcome.bytes_written = written;
        return outcome;
    } catch (const std::exception&) {
        return fail(make_error_code(FetchErrc::write_failed));
    }
}

//=============================================================================
// Metadata-only pass
//=============================================================================

std::expected<media::SegmentManifest, std::error_code>
FetchPipeline::fetch_metadata(const std::string& url, const disk::AssetDir& dir) noexcept {
    logger()->info("Fetching metadata for {} from {}", dir.name(), url);

    if (auto ec = dir.create()) {
        return std::unexpected(ec);
    }

    auto playlist = core::fetch_body(client_, url);
    if (!playlist) {
        logger()->error("Playlist fetch for {} failed: {}", dir.name(), playlist.error().message());
        return std::unexpected(playlist.error());
    }
    if (auto ec = dir.save_playlist(*playlist)) {
        return std::unexpected(ec);
    }

    auto manifest = media::PlaylistParser::parse(*playlist, url);
    if (!manifest) {
        logger()->error("Playlist for {} unusable: {}", dir.name(), manifest.error().message());
        return std::unexpected(manifest.error());
    }

    if (auto ec = dir.save_manifest(*manifest)) {
        return std::unexpected(ec);
    }
    if (auto ec = dir.save_encryption_info(manifest->encryption)) {
        return std::unexpected(ec);
    }

    if (manifest->is_encrypted()) {
        auto key = core::fetch_body(client_, manifest->encryption->key_uri);
        if (!key) {
            logger()->error("Key fetch for {} failed: {}", dir.name(), key.error().message());
            return std::unexpected(make_error_code(FetchErrc::key_unavailable));
        }
        if (key->size() != core::AES_KEY_SIZE) {
            logger()->error("Key for {} is {} bytes, expected {}", dir.name(), key->size(), core::AES_KEY_SIZE);
            return std::unexpected(make_error_code(FetchErrc::key_unavailable));
        }
        std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(key->data()), key->size());
        if (auto ec = dir.save_key(bytes)) {
            return std::unexpected(ec);
        }
    }

    disk::ContentLengths lengths;
    bool save_lengths = false;
    if (auto existing = dir.load_content_lengths()) {
        lengths = std::move(*existing);
    } else {
        // Missing, or corrupt and rebuilt from scratch
        save_lengths = true;
    }

    auto before = lengths.size();
    record_cheap_lengths(*manifest, lengths);
    if (lengths.size() != before) {
        save_lengths = true;
    }
    if (save_lengths) {
        if (auto ec = dir.save_content_lengths(lengths)) {
            return std::unexpected(ec);
        }
    }

    logger()->info("Metadata for {} ready: {} segment(s){}", dir.name(), manifest->segments.size(),
                   manifest->is_encrypted() ? ", AES-128" : "");
    return manifest;
}

void FetchPipeline::record_cheap_lengths(const media::SegmentManifest& manifest,
                                         disk::ContentLengths& lengths) noexcept {
    // Decrypted size differs from the transferred size, so nothing is cheap
    if (manifest.is_encrypted()) {
        return;
    }

    try {
        Throttle throttle(config_.delay());
        for (const auto& seg : manifest.segments) {
            if (lengths.contains(seg.index)) {
                continue;
            }
            if (seg.byte_range) {
                lengths[seg.index] = seg.byte_range->length;
                continue;
            }
            if (!config_.probe_content_lengths || !throttle.acquire({})) {
                continue;
            }

            auto head = client_.head(seg.uri);
            if (head && head->content_length && *head->content_length > 0) {
                lengths[seg.index] = *head->content_length;
            } else if (!head) {
                logger()->debug("HEAD {} failed: {}", seg.uri, head.error().message());
            }
        }
    } catch (const std::bad_alloc&) {
        logger()->warn("Content-length probing stopped: out of memory");
    }
}

} // namespace stitch::recovery
