/**
 * @file frame_decoder.h
 * @brief Incremental frame decoder for unframed JSON status streams
 *
 * The download server writes JSON objects back to back on a plain TCP stream,
 * without length prefixes or newlines. frame_decoder carves complete objects
 * out of arbitrarily chunked input by following the JSON structure, so braces
 * inside strings or nested values never end a frame early.
 */

#ifndef KCENON_XDCC_CLIENT_CORE_FRAME_DECODER_H
#define KCENON_XDCC_CLIENT_CORE_FRAME_DECODER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::xdcc_client {

/**
 * @brief One complete top-level JSON object taken from the stream
 */
struct frame {
    std::string payload;         ///< Bytes from the opening to the closing brace
    uint64_t stream_offset = 0;  ///< Offset of the opening brace in the stream
};

/**
 * @brief Frame decoder configuration
 */
struct frame_decoder_config {
    /// Largest candidate frame kept while waiting for its closing brace
    std::size_t max_frame_size = 64 * 1024;
};

/**
 * @brief Running counters for a frame_decoder
 */
struct frame_decoder_statistics {
    uint64_t bytes_fed = 0;            ///< Total bytes passed to feed()
    uint64_t frames_emitted = 0;       ///< Frames returned to the caller
    uint64_t candidates_rejected = 0;  ///< Opening braces dropped as noise
    uint64_t bytes_discarded = 0;      ///< Noise bytes dropped from the buffer
};

/**
 * @brief Restartable decoder turning a byte stream into JSON object frames
 *
 * A candidate starts at the first '{' in the buffer. Bytes are checked against
 * the JSON grammar as they arrive; the candidate is emitted when its outermost
 * object closes and the payload parses. When a byte cannot continue valid
 * JSON, when the closed payload does not parse, or when the candidate outgrows
 * max_frame_size, only the opening brace is dropped and the search restarts
 * right after it. Bytes before an emitted or rejected candidate are dropped
 * with it.
 *
 * The result never depends on how the stream was split across feed() calls.
 *
 * @code
 * frame_decoder decoder;
 * for (auto& f : decoder.feed(chunk)) {
 *     auto message = classify(f);
 * }
 * @endcode
 */
class frame_decoder {
public:
    frame_decoder();
    explicit frame_decoder(frame_decoder_config config);

    // Non-copyable, movable
    frame_decoder(const frame_decoder&) = delete;
    auto operator=(const frame_decoder&) -> frame_decoder& = delete;
    frame_decoder(frame_decoder&&) noexcept;
    auto operator=(frame_decoder&&) noexcept -> frame_decoder&;

    ~frame_decoder();

    /**
     * @brief Append bytes and extract every frame completed by them
     * @param data Newly received bytes
     * @return Frames in stream order (possibly empty)
     */
    [[nodiscard]] auto feed(std::span<const std::byte> data) -> std::vector<frame>;

    /**
     * @brief Append text and extract every frame completed by it
     */
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<frame>;

    /**
     * @brief Extract what the stream still holds once no more bytes will come
     *
     * An open candidate can never close, so its opening brace is rejected and
     * scanning restarts after it. Frames that complete on the rescan are
     * returned. Remaining bytes are discarded and the decoder is left empty.
     */
    [[nodiscard]] auto finish() -> std::vector<frame>;

    /**
     * @brief Check whether unconsumed bytes remain buffered
     */
    [[nodiscard]] auto has_pending() const noexcept -> bool;

    /**
     * @brief Number of unconsumed bytes currently buffered
     */
    [[nodiscard]] auto pending_size() const noexcept -> std::size_t;

    [[nodiscard]] auto statistics() const -> frame_decoder_statistics;

    [[nodiscard]] auto config() const -> const frame_decoder_config&;

    /**
     * @brief Drop all buffered bytes and scanner state
     */
    void reset();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::xdcc_client

#endif  // KCENON_XDCC_CLIENT_CORE_FRAME_DECODER_H
