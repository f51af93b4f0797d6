#pragma once

/**
 * @file slip.hpp
 * @brief SLIP frame codec used to delimit JSON envelopes on the platform TCP stream.
 *
 * @details
 * OVERVIEW
 * --------
 * TCP gives us an ordered byte stream with no message boundaries. Every envelope
 * the runtime exchanges with the platform is wrapped in a SLIP (RFC 1055) frame so
 * the receive loop can cut the stream back into whole envelopes, no matter how the
 * kernel split or coalesced the bytes.
 *
 * WIRE BYTES
 * ----------
 *   END       (0xC0) opens and closes a frame.
 *   ESC       (0xDB) introduces an escaped code.
 *   ESC_END   (0xDC) stands in for a literal END inside the payload.
 *   ESC_ESC   (0xDD) stands in for a literal ESC inside the payload.
 *
 * DECODER CONTRACT
 * ----------------
 * - Bytes before the first END are ignored (resynchronization point).
 * - Empty frames (END END) are ignored, so a leading END per frame is harmless.
 * - A malformed escape drops the partial frame and waits for the next END.
 * - A frame that grows past @ref decoder::max_frame is dropped the same way; a peer
 *   that never sends END cannot make us buffer without bound.
 * - @ref decoder::feed accepts whole chunks as returned by read(2) and can emit any
 *   number of frames per call.
 *
 * @author Leo
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cclink {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// Default upper bound for a single decoded frame (1 MiB).
static constexpr size_t DEFAULT_MAX_FRAME = 1u << 20;

/**
 * @brief Append one SLIP frame carrying @p n bytes from @p in to @p out.
 *
 * @details @p out is not cleared, so several frames can be batched into one
 * write buffer. Worst case growth is 2n + 2 bytes.
 */
inline void encode(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
    out.reserve(out.size() + n * 2 + 2);
    out.push_back(END);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = in[i];
        if (b == END) {
            out.push_back(ESC);
            out.push_back(ESC_END);
        } else if (b == ESC) {
            out.push_back(ESC);
            out.push_back(ESC_ESC);
        } else {
            out.push_back(b);
        }
    }
    out.push_back(END);
}

/// Convenience overload for text envelopes.
inline std::vector<uint8_t> encode(const std::string& text) {
    std::vector<uint8_t> out;
    encode(reinterpret_cast<const uint8_t*>(text.data()), text.size(), out);
    return out;
}

/**
 * @brief Stateful stream decoder. One instance per connection; not thread safe.
 */
class decoder {
public:
    explicit decoder(size_t max_frame = DEFAULT_MAX_FRAME) : max_frame_(max_frame) {}

    /**
     * @brief Feed a chunk of raw stream bytes.
     * @param data   bytes as read from the socket
     * @param n      number of bytes
     * @param frames receives every frame completed by this chunk (appended)
     * @return number of frames appended
     */
    size_t feed(const uint8_t* data, size_t n, std::vector<std::string>& frames) {
        size_t produced = 0;
        for (size_t i = 0; i < n; ++i) {
            if (feed_byte(data[i])) {
                frames.emplace_back(buf_.begin(), buf_.end());
                buf_.clear();
                ++produced;
            }
        }
        return produced;
    }

    /// Frames dropped because of malformed escapes or oversize payloads.
    size_t dropped() const { return dropped_; }

    /// Forget any partial frame (used when a connection is torn down).
    void reset() {
        buf_.clear();
        esc_ = false;
        in_frame_ = false;
    }

    size_t max_frame() const { return max_frame_; }

private:
    // true when END closed a non-empty frame; payload is left in buf_
    bool feed_byte(uint8_t b) {
        if (b == END) {
            if (in_frame_ && !buf_.empty()) {
                in_frame_ = false;
                esc_ = false;
                return true;
            }
            buf_.clear();
            in_frame_ = true;
            esc_ = false;
            return false;
        }

        if (!in_frame_) return false;

        if (esc_) {
            esc_ = false;
            if (b == ESC_END)      b = END;
            else if (b == ESC_ESC) b = ESC;
            else {
                drop();
                return false;
            }
        } else if (b == ESC) {
            esc_ = true;
            return false;
        }

        if (buf_.size() >= max_frame_) {
            drop();
            return false;
        }
        buf_.push_back(b);
        return false;
    }

    void drop() {
        buf_.clear();
        in_frame_ = false;
        esc_ = false;
        ++dropped_;
    }

    std::vector<uint8_t> buf_;
    size_t max_frame_;
    size_t dropped_ = 0;
    bool esc_ = false;
    bool in_frame_ = false;
};

} // namespace slip
} // namespace cclink
