/**
 * @file bitreader.hpp
 * @brief Sequential bit reading from a byte source.
 *
 * The bit reader pulls bytes from a wrapped source one at a time and hands
 * them out as fields of 1-64 bits, reading MSB-first within each byte.
 * At most 7 bits are held back between calls.
 *
 * @par Failure
 * The first error reported by the source is recorded. Later reads return
 * the same error without touching the source again. An invalid bit width
 * is rejected with Error::InvalidArg and leaves the reader unchanged.
 */

#ifndef BITIO_BITREADER_HPP
#define BITIO_BITREADER_HPP

#include "config.hpp"
#include "error.hpp"
#include "stream.hpp"

#include <utility>

namespace bitio {

/**
 * @brief Sequential bit reader over a byte source.
 *
 * @tparam Source Type meeting the byte source contract (see stream.hpp)
 */
template <typename Source>
class BitReader {
    static_assert(is_byte_source_v<Source>,
                  "Source must provide Error read_byte(std::uint8_t&)");

public:
    /// Source offers bulk read, used for byte-aligned read() calls
    static constexpr bool has_bulk_read = has_bulk_read_v<Source>;

    /**
     * @brief Construct a bit reader.
     *
     * @param source Byte source, owned by the reader from here on
     */
    explicit BitReader(Source source)
        : source_(std::move(source)), cache_(0), cached_bits_(0), error_(Error::Ok) {}

    /**
     * @brief Read multiple bits as unsigned value.
     *
     * Reads MSB-first; the result is right-aligned in value. Bytes are
     * pulled from the source only as needed.
     *
     * @param num_bits Number of bits to read (1-64)
     * @param[out] value Bits read, untouched on failure
     * @return Error::Ok on success, Error::InvalidArg for a bad width,
     *         otherwise the source error
     */
    Error read_bits(std::size_t num_bits, std::uint64_t& value) {
        if (num_bits == 0 || num_bits > MAX_BIT_WIDTH) [[unlikely]] {
            return Error::InvalidArg;
        }
        if (error_ != Error::Ok) [[unlikely]] {
            return error_;
        }

        // Fully served from the cache
        if (num_bits <= cached_bits_) {
            std::size_t shift = cached_bits_ - num_bits;
            value = static_cast<std::uint64_t>(cache_ >> shift);
            cache_ = static_cast<std::uint8_t>(cache_ & low_mask(shift));
            cached_bits_ = shift;
            return Error::Ok;
        }

        std::uint64_t result = cache_;
        std::size_t remaining = num_bits - cached_bits_;
        std::uint8_t byte = 0;

        while (remaining >= BITS_PER_BYTE) {
            Error status = fetch(byte);
            if (status != Error::Ok) {
                return status;
            }
            result = (result << BITS_PER_BYTE) | byte;
            remaining -= BITS_PER_BYTE;
        }

        std::uint8_t next_cache = 0;
        std::size_t next_bits = 0;
        if (remaining > 0) {
            Error status = fetch(byte);
            if (status != Error::Ok) {
                return status;
            }
            next_bits = BITS_PER_BYTE - remaining;
            result = (result << remaining) | static_cast<std::uint64_t>(byte >> next_bits);
            next_cache = static_cast<std::uint8_t>(byte & low_mask(next_bits));
        }

        cache_ = next_cache;
        cached_bits_ = next_bits;
        value = result;
        return Error::Ok;
    }

    /**
     * @brief Read a single bit.
     *
     * @param[out] value true for 1, false for 0
     * @return Error::Ok on success, otherwise the source error
     */
    Error read_bool(bool& value) {
        std::uint64_t bit = 0;
        Error status = read_bits(1, bit);
        if (status == Error::Ok) {
            value = (bit != 0);
        }
        return status;
    }

    /**
     * @brief Read the next 8 bits.
     *
     * Byte-aligned reads go straight to the source. Otherwise the cached
     * bits are completed with the high bits of a fresh source byte, and its
     * low bits become the new cache.
     *
     * @param[out] value Byte read, untouched on failure
     * @return Error::Ok on success, otherwise the source error
     */
    Error read_byte(std::uint8_t& value) {
        if (error_ != Error::Ok) [[unlikely]] {
            return error_;
        }

        if (cached_bits_ == 0) [[likely]] {
            return fetch(value);
        }

        std::uint8_t byte = 0;
        Error status = fetch(byte);
        if (status != Error::Ok) {
            return status;
        }
        value = static_cast<std::uint8_t>((cache_ << (BITS_PER_BYTE - cached_bits_)) |
                                          (byte >> cached_bits_));
        cache_ = static_cast<std::uint8_t>(byte & low_mask(cached_bits_));
        return Error::Ok;
    }

    /**
     * @brief Fill a buffer with the next bytes.
     *
     * When byte-aligned and the source supports bulk reads, the whole
     * request is delegated to the source. Otherwise bytes are read one by
     * one with read_byte().
     *
     * @param data Destination buffer
     * @param len Number of bytes requested
     * @param[out] count Number of bytes actually filled
     * @return Error::Ok if all len bytes were filled, otherwise the error
     *         that stopped the read
     */
    Error read(std::uint8_t* data, std::size_t len, std::size_t& count) {
        count = 0;
        if (error_ != Error::Ok) [[unlikely]] {
            return error_;
        }

        if constexpr (has_bulk_read) {
            if (cached_bits_ == 0) {
                Error status = source_.read(data, len, count);
                if (status != Error::Ok) {
                    error_ = status;
                }
                return status;
            }
        }

        for (std::size_t i = 0; i < len; ++i) {
            Error status = read_byte(data[i]);
            if (status != Error::Ok) {
                return status;
            }
            ++count;
        }
        return Error::Ok;
    }

    /**
     * @brief Skip to next byte boundary.
     *
     * Discards the cached bits. Never touches the source.
     *
     * @return Number of bits discarded (0-7)
     */
    std::size_t align() noexcept {
        std::size_t skipped = cached_bits_;
        cache_ = 0;
        cached_bits_ = 0;
        return skipped;
    }

#if !BITIO_NO_EXCEPTIONS
    /**
     * @brief Read multiple bits, throwing on failure.
     *
     * @param num_bits Number of bits to read (1-64)
     * @return Bits read, right-aligned
     * @throws BitioException subclass matching the error
     */
    std::uint64_t read_bits(std::size_t num_bits) {
        std::uint64_t value = 0;
        throw_if_error(read_bits(num_bits, value));
        return value;
    }

    bool read_bool() {
        bool value = false;
        throw_if_error(read_bool(value));
        return value;
    }

    std::uint8_t read_byte() {
        std::uint8_t value = 0;
        throw_if_error(read_byte(value));
        return value;
    }
#endif // !BITIO_NO_EXCEPTIONS

    [[nodiscard]] bool aligned() const noexcept {
        return cached_bits_ == 0;
    }

    /**
     * @brief Get number of bits pulled from the source but not yet read.
     * @return Cached bit count (0-7)
     */
    [[nodiscard]] std::size_t cached_bits() const noexcept {
        return cached_bits_;
    }

    /**
     * @brief Get the recorded source failure.
     * @return Error::Ok while the source has not failed
     */
    [[nodiscard]] Error error() const noexcept {
        return error_;
    }

    [[nodiscard]] const Source& source() const noexcept {
        return source_;
    }

private:
    Source source_;
    std::uint8_t cache_;      // unread bits, right-aligned
    std::size_t cached_bits_; // 0-7
    Error error_;

    static constexpr unsigned low_mask(std::size_t bits) noexcept {
        return (1U << bits) - 1U;
    }

    Error fetch(std::uint8_t& byte) {
        Error status = source_.read_byte(byte);
        if (status != Error::Ok) [[unlikely]] {
            error_ = status;
        }
        return status;
    }
};

} // namespace bitio

#endif // BITIO_BITREADER_HPP
