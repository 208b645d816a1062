#pragma once

/**
 * @page mb-slip MeshBot SLIP Framing
 * @file slip.hpp
 * @brief SLIP encoder/decoder that delimits bridge JSON frames on a serial link.
 *
 * @details
 * OVERVIEW
 * --------
 * When the bridge sits at the far end of a serial TTY, JSON event frames are
 * carried inside SLIP frames. SLIP wraps a payload between END sentinels and
 * escapes any sentinel that shows up inside it. That gives exact frame
 * boundaries on a raw byte stream, and lets the decoder resynchronize after
 * boot chatter or line noise.
 *
 * CODES
 * -----
 *   END       (0xC0) frame boundary
 *   ESC       (0xDB) escape introducer
 *   ESC_END   (0xDC) ESC, ESC_END  -> literal END
 *   ESC_ESC   (0xDD) ESC, ESC_ESC  -> literal ESC
 *
 * DECODER RULES
 * -------------
 * - Bytes before the first END are noise and ignored.
 * - END closes a non-empty frame; END END is just a separator.
 * - ESC followed by anything but ESC_END/ESC_ESC drops the frame in progress.
 * - A frame growing past `max_frame` bytes is dropped; the decoder then
 *   waits for the next END. A runaway bridge cannot exhaust memory.
 *
 * EXAMPLE
 * -------
 * @code
 *   meshbot::slip::Decoder dec;
 *   std::string frame;
 *   for (char c : chunk) {
 *     if (dec.feed(static_cast<uint8_t>(c), frame)) handle(frame);
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace meshbot {
namespace slip {

static constexpr uint8_t END     = 0xC0;  ///< frame boundary
static constexpr uint8_t ESC     = 0xDB;  ///< escape introducer
static constexpr uint8_t ESC_END = 0xDC;  ///< escaped END
static constexpr uint8_t ESC_ESC = 0xDD;  ///< escaped ESC

/// Default upper bound for one decoded frame.
static constexpr size_t MAX_FRAME_DEFAULT = 64 * 1024;

/**
 * @brief Wrap @p payload into one SLIP frame: END, escaped bytes, END.
 */
inline std::string encode(const std::string& payload) {
    std::string out;
    out.reserve(payload.size() * 2 + 2);      // worst case: every byte escapes
    out.push_back(static_cast<char>(END));
    for (char ch : payload) {
        const uint8_t b = static_cast<uint8_t>(ch);
        if (b == END) {
            out.push_back(static_cast<char>(ESC));
            out.push_back(static_cast<char>(ESC_END));
        } else if (b == ESC) {
            out.push_back(static_cast<char>(ESC));
            out.push_back(static_cast<char>(ESC_ESC));
        } else {
            out.push_back(ch);
        }
    }
    out.push_back(static_cast<char>(END));
    return out;
}

/**
 * @class Decoder
 * @brief Byte-at-a-time SLIP decoder with a frame size guard.
 */
class Decoder {
public:
    explicit Decoder(size_t max_frame = MAX_FRAME_DEFAULT) : max_frame_(max_frame) {}

    /**
     * @brief Feed one byte.
     * @return true when @p frame now holds one complete payload.
     */
    bool feed(uint8_t b, std::string& frame) {
        if (b == END) {
            const bool complete = in_frame_ && !buf_.empty();
            if (complete) frame.swap(buf_);
            buf_.clear();
            in_frame_ = true;                // END also opens the next frame
            esc_ = false;
            return complete;
        }

        if (!in_frame_) return false;        // noise before the first END

        if (esc_) {
            esc_ = false;
            if      (b == ESC_END) b = END;
            else if (b == ESC_ESC) b = ESC;
            else { drop(); return false; }   // malformed escape
        } else if (b == ESC) {
            esc_ = true;
            return false;
        }

        if (buf_.size() >= max_frame_) { drop(); return false; }
        buf_.push_back(static_cast<char>(b));
        return false;
    }

    /// Frames discarded for malformed escapes or size.
    size_t dropped() const { return dropped_; }

    void reset() { buf_.clear(); in_frame_ = false; esc_ = false; }

private:
    void drop() {
        ++dropped_;
        reset();                             // resync on the next END
    }

    std::string buf_;
    size_t      max_frame_;
    size_t      dropped_{0};
    bool        in_frame_{false};
    bool        esc_{false};
};

} // namespace slip
} // namespace meshbot
