/**
 * @file bitwriter.hpp
 * @brief Sequential bit writing to a byte sink.
 *
 * The bit writer packs fields of 1-64 bits into bytes MSB-first and hands
 * every completed byte to the wrapped sink. Up to 7 bits wait in the cache
 * between calls, so the writer must be finished with close(), which pads
 * the last byte with zero bits. The destructor does not flush.
 *
 * @par Bit Ordering
 * The output is one continuous MSB-first bit sequence no matter how it is
 * split into calls:
 * - First bit written goes to bit position 7 of the first byte
 * - Second bit goes to position 6, etc.
 *
 * @par Failure
 * The first error reported by the sink is recorded and returned by every
 * later write without touching the sink again. Bytes flushed before the
 * failure stay flushed. After close() all writes return Error::Closed.
 */

#ifndef BITIO_BITWRITER_HPP
#define BITIO_BITWRITER_HPP

#include "config.hpp"
#include "error.hpp"
#include "stream.hpp"

#include <utility>

namespace bitio {

/**
 * @brief Sequential bit writer over a byte sink.
 *
 * @tparam Sink Type meeting the byte sink contract (see stream.hpp)
 */
template <typename Sink>
class BitWriter {
    static_assert(is_byte_sink_v<Sink>, "Sink must provide Error write_byte(std::uint8_t)");

public:
    /// Sink offers bulk write, used for byte-aligned write() calls
    static constexpr bool has_bulk_write = has_bulk_write_v<Sink>;

    /// Sink offers close(), called by BitWriter::close()
    static constexpr bool has_close = has_close_v<Sink>;

    /**
     * @brief Construct a bit writer.
     *
     * @param sink Byte sink, owned by the writer from here on
     */
    explicit BitWriter(Sink sink)
        : sink_(std::move(sink)), cache_(0), cached_bits_(0), error_(Error::Ok),
          closed_(false) {}

    /**
     * @brief Write the low bits of a value.
     *
     * The most significant of the num_bits bits is written first. Bits of
     * value above num_bits are ignored.
     *
     * @param value Value containing bits (right-justified)
     * @param num_bits Number of bits to write (1-64)
     * @return Error::Ok on success, Error::InvalidArg for a bad width,
     *         otherwise the sink error
     */
    Error write_bits(std::uint64_t value, std::size_t num_bits) {
        if (num_bits == 0 || num_bits > MAX_BIT_WIDTH) [[unlikely]] {
            return Error::InvalidArg;
        }
        if (Error status = state(); status != Error::Ok) [[unlikely]] {
            return status;
        }

        if (num_bits < MAX_BIT_WIDTH) {
            value &= (std::uint64_t{1} << num_bits) - 1U;
        }

        std::size_t total = cached_bits_ + num_bits;
        if (total < BITS_PER_BYTE) {
            // Fits into the cache, nothing reaches the sink
            cache_ = static_cast<std::uint8_t>(cache_ | (value << (BITS_PER_BYTE - total)));
            cached_bits_ = total;
            return Error::Ok;
        }

        // Complete the cached byte
        std::size_t remaining = total - BITS_PER_BYTE;
        Error status = put(static_cast<std::uint8_t>(cache_ | (value >> remaining)));
        if (status != Error::Ok) {
            return status;
        }

        while (remaining >= BITS_PER_BYTE) {
            remaining -= BITS_PER_BYTE;
            status = put(static_cast<std::uint8_t>(value >> remaining));
            if (status != Error::Ok) {
                return status;
            }
        }

        // Truncation to a byte drops everything above the remaining bits
        cache_ = (remaining > 0)
                     ? static_cast<std::uint8_t>(value << (BITS_PER_BYTE - remaining))
                     : std::uint8_t{0};
        cached_bits_ = remaining;
        return Error::Ok;
    }

    /**
     * @brief Write a single bit.
     *
     * @param value Bit value
     * @return Error::Ok on success, otherwise the sink error
     */
    Error write_bool(bool value) {
        return write_bits(value ? 1U : 0U, 1);
    }

    /**
     * @brief Write 8 bits.
     *
     * Byte-aligned writes go straight to the sink. Otherwise the high bits
     * of the byte complete the cached byte and its low bits become the new
     * cache.
     *
     * @param value Byte to write
     * @return Error::Ok on success, otherwise the sink error
     */
    Error write_byte(std::uint8_t value) {
        if (Error status = state(); status != Error::Ok) [[unlikely]] {
            return status;
        }

        if (cached_bits_ == 0) [[likely]] {
            return put(value);
        }

        Error status = put(static_cast<std::uint8_t>(cache_ | (value >> cached_bits_)));
        if (status != Error::Ok) {
            return status;
        }
        cache_ = static_cast<std::uint8_t>(value << (BITS_PER_BYTE - cached_bits_));
        return Error::Ok;
    }

    /**
     * @brief Write a buffer of bytes.
     *
     * When byte-aligned and the sink supports bulk writes, the whole buffer
     * is delegated to the sink. Otherwise bytes are written one by one with
     * write_byte().
     *
     * @param data Source bytes
     * @param len Number of bytes to write
     * @param[out] count Number of bytes actually written
     * @return Error::Ok if all len bytes were written, otherwise the first
     *         error encountered
     */
    Error write(const std::uint8_t* data, std::size_t len, std::size_t& count) {
        count = 0;
        if (Error status = state(); status != Error::Ok) [[unlikely]] {
            return status;
        }

        if constexpr (has_bulk_write) {
            if (cached_bits_ == 0) {
                Error status = sink_.write(data, len, count);
                if (status != Error::Ok) {
                    error_ = status;
                }
                return status;
            }
        }

        for (std::size_t i = 0; i < len; ++i) {
            Error status = write_byte(data[i]);
            if (status != Error::Ok) {
                return status;
            }
            ++count;
        }
        return Error::Ok;
    }

    /**
     * @brief Pad to the next byte boundary.
     *
     * Fills the cached byte with zero bits and flushes it. Does nothing
     * when already byte-aligned.
     *
     * @param[out] padding_bits Number of zero bits added (0-7), 0 on failure
     * @return Error::Ok on success, otherwise the sink error
     */
    Error align(std::size_t& padding_bits) {
        padding_bits = 0;
        if (Error status = state(); status != Error::Ok) [[unlikely]] {
            return status;
        }
        if (cached_bits_ == 0) {
            return Error::Ok;
        }

        Error status = put(cache_);
        if (status != Error::Ok) {
            return status;
        }
        padding_bits = BITS_PER_BYTE - cached_bits_;
        cache_ = 0;
        cached_bits_ = 0;
        return Error::Ok;
    }

    /**
     * @brief Flush the trailing partial byte and close the sink.
     *
     * The sink's close() is called even when the flush fails. A flush
     * failure takes precedence over a close failure.
     *
     * @return Error::Ok on success, Error::Closed if already closed,
     *         otherwise the flush error or the close error
     */
    Error close() {
        if (closed_) {
            return Error::Closed;
        }

        std::size_t padding_bits = 0;
        Error flush_status = align(padding_bits);
        closed_ = true;

        Error close_status = Error::Ok;
        if constexpr (has_close) {
            close_status = sink_.close();
        }

        if (flush_status != Error::Ok) {
            return flush_status;
        }
        if (close_status != Error::Ok) {
            error_ = close_status;
        }
        return close_status;
    }

    [[nodiscard]] bool aligned() const noexcept {
        return cached_bits_ == 0;
    }

    /**
     * @brief Get number of bits written but not yet flushed.
     * @return Cached bit count (0-7)
     */
    [[nodiscard]] std::size_t cached_bits() const noexcept {
        return cached_bits_;
    }

    /**
     * @brief Get the recorded sink failure.
     * @return Error::Ok while the sink has not failed
     */
    [[nodiscard]] Error error() const noexcept {
        return error_;
    }

    [[nodiscard]] bool closed() const noexcept {
        return closed_;
    }

    [[nodiscard]] const Sink& sink() const noexcept {
        return sink_;
    }

private:
    Sink sink_;
    std::uint8_t cache_;      // pending bits, left-aligned
    std::size_t cached_bits_; // 0-7
    Error error_;
    bool closed_;

    Error state() const noexcept {
        return closed_ ? Error::Closed : error_;
    }

    Error put(std::uint8_t byte) {
        Error status = sink_.write_byte(byte);
        if (status != Error::Ok) [[unlikely]] {
            error_ = status;
        }
        return status;
    }
};

} // namespace bitio

#endif // BITIO_BITWRITER_HPP
