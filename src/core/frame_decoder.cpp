/**
 * @file frame_decoder.cpp
 * @brief Implementation of the incremental JSON frame decoder
 */

#include "kcenon/xdcc_client/core/frame_decoder.h"
#include "kcenon/xdcc_client/core/logging.h"

#include <nlohmann/json.hpp>

namespace kcenon::xdcc_client {

namespace {

/**
 * @brief Byte-at-a-time JSON grammar follower for one top-level object
 *
 * Validates structure only: containers, strings with escapes, literals and
 * the character set of numbers. Number syntax is checked by the full parse
 * that runs once the object closes.
 */
class structure_scanner {
public:
    enum class verdict {
        need_more,
        complete,
        invalid
    };

    void reset() {
        stack_.clear();
        expect_ = expect::value;
        token_ = token::none;
        string_is_key_ = false;
        unicode_digits_ = 0;
        literal_ = {};
        literal_pos_ = 0;
    }

    auto consume(char c) -> verdict {
        switch (token_) {
            case token::string:
                return consume_string(c);
            case token::string_escape:
                return consume_escape(c);
            case token::string_unicode:
                return consume_unicode(c);
            case token::literal:
                return consume_literal(c);
            case token::number:
                if (is_number_char(c)) {
                    return verdict::need_more;
                }
                token_ = token::none;
                expect_ = expect::comma_or_close;
                break;  // c terminates the number and is handled below
            case token::none:
                break;
        }

        if (is_whitespace(c)) {
            return stack_.empty() ? verdict::invalid : verdict::need_more;
        }

        switch (expect_) {
            case expect::key_or_close:
                if (c == '}') return close_container(c);
                return begin_key(c);
            case expect::key:
                return begin_key(c);
            case expect::colon:
                if (c != ':') return verdict::invalid;
                expect_ = expect::value;
                return verdict::need_more;
            case expect::value_or_close:
                if (c == ']') return close_container(c);
                return begin_value(c);
            case expect::value:
                return begin_value(c);
            case expect::comma_or_close:
                if (c == ',') {
                    expect_ = (stack_.back() == '{') ? expect::key : expect::value;
                    return verdict::need_more;
                }
                if (c == '}' || c == ']') return close_container(c);
                return verdict::invalid;
        }
        return verdict::invalid;
    }

private:
    enum class expect {
        value,
        value_or_close,
        key,
        key_or_close,
        colon,
        comma_or_close
    };

    enum class token {
        none,
        string,
        string_escape,
        string_unicode,
        number,
        literal
    };

    static auto is_whitespace(char c) -> bool {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    static auto is_digit(char c) -> bool {
        return c >= '0' && c <= '9';
    }

    static auto is_number_char(char c) -> bool {
        return is_digit(c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
    }

    static auto is_hex_digit(char c) -> bool {
        return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    auto begin_key(char c) -> verdict {
        if (c != '"') return verdict::invalid;
        token_ = token::string;
        string_is_key_ = true;
        return verdict::need_more;
    }

    auto begin_value(char c) -> verdict {
        // The outermost value of a frame is always an object
        if (stack_.empty() && c != '{') {
            return verdict::invalid;
        }

        switch (c) {
            case '{':
                stack_.push_back('{');
                expect_ = expect::key_or_close;
                return verdict::need_more;
            case '[':
                stack_.push_back('[');
                expect_ = expect::value_or_close;
                return verdict::need_more;
            case '"':
                token_ = token::string;
                string_is_key_ = false;
                return verdict::need_more;
            case 't':
                return begin_literal("true");
            case 'f':
                return begin_literal("false");
            case 'n':
                return begin_literal("null");
            default:
                if (c == '-' || is_digit(c)) {
                    token_ = token::number;
                    return verdict::need_more;
                }
                return verdict::invalid;
        }
    }

    auto begin_literal(std::string_view literal) -> verdict {
        token_ = token::literal;
        literal_ = literal;
        literal_pos_ = 1;
        return verdict::need_more;
    }

    auto close_container(char c) -> verdict {
        const char opener = (c == '}') ? '{' : '[';
        if (stack_.empty() || stack_.back() != opener) {
            return verdict::invalid;
        }
        stack_.pop_back();
        if (stack_.empty()) {
            return verdict::complete;
        }
        expect_ = expect::comma_or_close;
        return verdict::need_more;
    }

    auto consume_string(char c) -> verdict {
        if (c == '\\') {
            token_ = token::string_escape;
            return verdict::need_more;
        }
        if (c == '"') {
            token_ = token::none;
            expect_ = string_is_key_ ? expect::colon : expect::comma_or_close;
            return verdict::need_more;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return verdict::invalid;
        }
        return verdict::need_more;
    }

    auto consume_escape(char c) -> verdict {
        switch (c) {
            case '"': case '\\': case '/':
            case 'b': case 'f': case 'n': case 'r': case 't':
                token_ = token::string;
                return verdict::need_more;
            case 'u':
                token_ = token::string_unicode;
                unicode_digits_ = 0;
                return verdict::need_more;
            default:
                return verdict::invalid;
        }
    }

    auto consume_unicode(char c) -> verdict {
        if (!is_hex_digit(c)) {
            return verdict::invalid;
        }
        if (++unicode_digits_ == 4) {
            token_ = token::string;
        }
        return verdict::need_more;
    }

    auto consume_literal(char c) -> verdict {
        if (c != literal_[literal_pos_]) {
            return verdict::invalid;
        }
        if (++literal_pos_ == literal_.size()) {
            token_ = token::none;
            expect_ = expect::comma_or_close;
        }
        return verdict::need_more;
    }

    std::vector<char> stack_;
    expect expect_ = expect::value;
    token token_ = token::none;
    bool string_is_key_ = false;
    int unicode_digits_ = 0;
    std::string_view literal_;
    std::size_t literal_pos_ = 0;
};

}  // namespace

/**
 * @brief Implementation details for frame_decoder
 */
struct frame_decoder::impl {
    frame_decoder_config cfg;
    frame_decoder_statistics stats;

    std::string buffer;
    uint64_t buffer_offset = 0;  // stream offset of buffer[0]

    // Scan position: next byte to look at in buffer
    std::size_t scan_pos = 0;
    bool in_candidate = false;
    std::size_t candidate_start = 0;
    structure_scanner scanner;

    explicit impl(frame_decoder_config c) : cfg(std::move(c)) {}

    void drop_front(std::size_t count) {
        buffer.erase(0, count);
        buffer_offset += count;
        scan_pos = 0;
        in_candidate = false;
    }

    void reject_candidate(const char* reason) {
        XC_LOG_DEBUG(log_category::decoder,
            std::string("Dropping candidate frame at offset ") +
            std::to_string(buffer_offset + candidate_start) + ": " + reason);

        stats.candidates_rejected++;
        stats.bytes_discarded += candidate_start + 1;
        drop_front(candidate_start + 1);
    }

    void emit_candidate(std::vector<frame>& out) {
        std::string payload = buffer.substr(candidate_start, scan_pos - candidate_start);
        if (!nlohmann::json::accept(payload)) {
            reject_candidate("payload does not parse");
            return;
        }

        frame f;
        f.payload = std::move(payload);
        f.stream_offset = buffer_offset + candidate_start;
        out.push_back(std::move(f));

        stats.frames_emitted++;
        stats.bytes_discarded += candidate_start;
        drop_front(scan_pos);
    }

    auto start_candidate() -> bool {
        auto open = buffer.find('{', scan_pos);
        if (open == std::string::npos) {
            // Noise with no opening brace can never join a frame
            if (buffer.size() > cfg.max_frame_size) {
                XC_LOG_WARN(log_category::decoder,
                    "Discarding " + std::to_string(buffer.size()) +
                    " bytes of unframed data");
                stats.bytes_discarded += buffer.size();
                drop_front(buffer.size());
            } else {
                scan_pos = buffer.size();
            }
            return false;
        }

        in_candidate = true;
        candidate_start = open;
        scanner.reset();
        (void)scanner.consume('{');
        scan_pos = open + 1;
        return true;
    }

    void drain(std::vector<frame>& out) {
        for (;;) {
            if (!in_candidate && !start_candidate()) {
                return;
            }

            bool restart = false;
            while (!restart && scan_pos < buffer.size()) {
                auto verdict = scanner.consume(buffer[scan_pos]);
                ++scan_pos;

                switch (verdict) {
                    case structure_scanner::verdict::complete:
                        emit_candidate(out);
                        restart = true;
                        break;
                    case structure_scanner::verdict::invalid:
                        reject_candidate("not valid JSON");
                        restart = true;
                        break;
                    case structure_scanner::verdict::need_more:
                        if (scan_pos - candidate_start > cfg.max_frame_size) {
                            reject_candidate("exceeds maximum frame size");
                            restart = true;
                        }
                        break;
                }
            }

            if (!restart) {
                return;  // candidate still open, wait for more bytes
            }
        }
    }
};

frame_decoder::frame_decoder() : frame_decoder(frame_decoder_config{}) {}

frame_decoder::frame_decoder(frame_decoder_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

frame_decoder::frame_decoder(frame_decoder&&) noexcept = default;
auto frame_decoder::operator=(frame_decoder&&) noexcept -> frame_decoder& = default;
frame_decoder::~frame_decoder() = default;

auto frame_decoder::feed(std::span<const std::byte> data) -> std::vector<frame> {
    return feed(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

auto frame_decoder::feed(std::string_view data) -> std::vector<frame> {
    std::vector<frame> frames;
    if (data.empty()) {
        return frames;
    }

    impl_->stats.bytes_fed += data.size();
    impl_->buffer.append(data.data(), data.size());
    impl_->drain(frames);
    return frames;
}

auto frame_decoder::finish() -> std::vector<frame> {
    std::vector<frame> frames;
    impl_->drain(frames);
    while (impl_->in_candidate) {
        impl_->reject_candidate("stream ended inside frame");
        impl_->drain(frames);
    }

    if (!impl_->buffer.empty()) {
        XC_LOG_DEBUG(log_category::decoder,
            "Discarding " + std::to_string(impl_->buffer.size()) +
            " undecoded bytes at end of stream");
        impl_->stats.bytes_discarded += impl_->buffer.size();
        impl_->drop_front(impl_->buffer.size());
    }
    return frames;
}

auto frame_decoder::has_pending() const noexcept -> bool {
    return !impl_->buffer.empty();
}

auto frame_decoder::pending_size() const noexcept -> std::size_t {
    return impl_->buffer.size();
}

auto frame_decoder::statistics() const -> frame_decoder_statistics {
    return impl_->stats;
}

auto frame_decoder::config() const -> const frame_decoder_config& {
    return impl_->cfg;
}

void frame_decoder::reset() {
    impl_->buffer.clear();
    impl_->buffer_offset = 0;
    impl_->scan_pos = 0;
    impl_->in_candidate = false;
    impl_->candidate_start = 0;
    impl_->scanner.reset();
}

}  // namespace kcenon::xdcc_client
