/**
 * @file stream.hpp
 * @brief Byte stream capability contract and ready-made adapters.
 *
 * BitReader and BitWriter wrap any type that meets a two-tier member
 * contract. The required tier is a single-byte operation, the optional tier
 * adds bulk transfer (and close, for sinks). Which optional operations a
 * type offers is detected at compile time by the traits below.
 *
 * @par Byte source
 * - required: `Error read_byte(std::uint8_t& byte)`, returning
 *   Error::EndOfData when exhausted
 * - optional: `Error read(std::uint8_t* data, std::size_t len, std::size_t& count)`
 *
 * @par Byte sink
 * - required: `Error write_byte(std::uint8_t byte)`
 * - optional: `Error write(const std::uint8_t* data, std::size_t len, std::size_t& count)`
 * - optional: `Error close()`
 *
 * Bulk operations either transfer all `len` bytes and return Error::Ok, or
 * return the reason they stopped with `count` set to the bytes transferred.
 */

#ifndef BITIO_STREAM_HPP
#define BITIO_STREAM_HPP

#include "config.hpp"
#include "error.hpp"

#include <array>
#include <cstring>
#include <istream>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

namespace bitio {

/**
 * @defgroup traits Capability Detection
 * @{
 */

template <typename T, typename = void>
struct is_byte_source : std::false_type {};

template <typename T>
struct is_byte_source<
    T, std::void_t<decltype(std::declval<T&>().read_byte(std::declval<std::uint8_t&>()))>>
    : std::is_same<decltype(std::declval<T&>().read_byte(std::declval<std::uint8_t&>())),
                   Error> {};

template <typename T, typename = void>
struct has_bulk_read : std::false_type {};

template <typename T>
struct has_bulk_read<T, std::void_t<decltype(std::declval<T&>().read(
                            std::declval<std::uint8_t*>(), std::declval<std::size_t>(),
                            std::declval<std::size_t&>()))>>
    : std::is_same<decltype(std::declval<T&>().read(std::declval<std::uint8_t*>(),
                                                     std::declval<std::size_t>(),
                                                     std::declval<std::size_t&>())),
                   Error> {};

template <typename T, typename = void>
struct is_byte_sink : std::false_type {};

template <typename T>
struct is_byte_sink<
    T, std::void_t<decltype(std::declval<T&>().write_byte(std::declval<std::uint8_t>()))>>
    : std::is_same<decltype(std::declval<T&>().write_byte(std::declval<std::uint8_t>())),
                   Error> {};

template <typename T, typename = void>
struct has_bulk_write : std::false_type {};

template <typename T>
struct has_bulk_write<T, std::void_t<decltype(std::declval<T&>().write(
                             std::declval<const std::uint8_t*>(), std::declval<std::size_t>(),
                             std::declval<std::size_t&>()))>>
    : std::is_same<decltype(std::declval<T&>().write(std::declval<const std::uint8_t*>(),
                                                      std::declval<std::size_t>(),
                                                      std::declval<std::size_t&>())),
                   Error> {};

template <typename T, typename = void>
struct has_close : std::false_type {};

template <typename T>
struct has_close<T, std::void_t<decltype(std::declval<T&>().close())>>
    : std::is_same<decltype(std::declval<T&>().close()), Error> {};

template <typename T>
inline constexpr bool is_byte_source_v = is_byte_source<T>::value;

template <typename T>
inline constexpr bool has_bulk_read_v = has_bulk_read<T>::value;

template <typename T>
inline constexpr bool is_byte_sink_v = is_byte_sink<T>::value;

template <typename T>
inline constexpr bool has_bulk_write_v = has_bulk_write<T>::value;

template <typename T>
inline constexpr bool has_close_v = has_close<T>::value;

/** @} */

/**
 * @brief Byte source over a caller-owned memory buffer.
 *
 * The buffer must outlive the source.
 */
class MemorySource {
public:
    /**
     * @brief Construct a memory source.
     *
     * @param data Pointer to source data buffer
     * @param size Number of bytes in buffer
     */
    MemorySource(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    explicit MemorySource(const std::vector<std::uint8_t>& data) noexcept
        : MemorySource(data.data(), data.size()) {}

    Error read_byte(std::uint8_t& byte) noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return Error::EndOfData;
        }
        byte = data_[pos_++];
        return Error::Ok;
    }

    Error read(std::uint8_t* data, std::size_t len, std::size_t& count) noexcept {
        std::size_t available = size_ - pos_;
        count = (len < available) ? len : available;
        if (count > 0) {
            std::memcpy(data, data_ + pos_, count);
            pos_ += count;
        }
        return (count == len) ? Error::Ok : Error::EndOfData;
    }

    /**
     * @brief Get current byte position.
     * @return Number of bytes already delivered
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     * @return Number of bytes not yet delivered
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

/**
 * @brief Byte sink appending to a growing vector.
 */
class VectorSink {
public:
    VectorSink() = default;

    /**
     * @brief Construct with reserved capacity.
     * @param reserve_bytes Bytes to reserve up front
     */
    explicit VectorSink(std::size_t reserve_bytes) {
        bytes_.reserve(reserve_bytes);
    }

    Error write_byte(std::uint8_t byte) {
        bytes_.push_back(byte);
        return Error::Ok;
    }

    Error write(const std::uint8_t* data, std::size_t len, std::size_t& count) {
        bytes_.insert(bytes_.end(), data, data + len);
        count = len;
        return Error::Ok;
    }

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept {
        return bytes_;
    }

    /**
     * @brief Move the collected bytes out, leaving the sink empty.
     */
    std::vector<std::uint8_t> release() noexcept {
        return std::exchange(bytes_, {});
    }

private:
    std::vector<std::uint8_t> bytes_;
};

/**
 * @brief Byte sink with static allocation.
 *
 * @tparam MaxBytes Maximum output size in bytes
 *
 * No heap allocation. Writes beyond capacity fail with Error::Overflow.
 */
template <std::size_t MaxBytes>
class ArraySink {
public:
    constexpr ArraySink() noexcept : data_{}, size_(0) {}

    Error write_byte(std::uint8_t byte) noexcept {
        if (size_ >= MaxBytes) [[unlikely]] {
            return Error::Overflow;
        }
        data_[size_++] = byte;
        return Error::Ok;
    }

    Error write(const std::uint8_t* data, std::size_t len, std::size_t& count) noexcept {
        std::size_t space = MaxBytes - size_;
        count = (len < space) ? len : space;
        if (count > 0) {
            std::memcpy(data_.data() + size_, data, count);
            size_ += count;
        }
        return (count == len) ? Error::Ok : Error::Overflow;
    }

    [[nodiscard]] const std::uint8_t* data() const noexcept {
        return data_.data();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return MaxBytes;
    }

private:
    std::array<std::uint8_t, MaxBytes> data_;
    std::size_t size_;
};

/**
 * @brief Byte source reading from a std::istream.
 *
 * The stream must be opened in binary mode and outlive the source.
 */
class IstreamSource {
public:
    explicit IstreamSource(std::istream& in) noexcept : in_(&in) {}

    Error read_byte(std::uint8_t& byte) {
        std::istream::int_type c = in_->get();
        if (std::istream::traits_type::eq_int_type(c, std::istream::traits_type::eof())) {
            return in_->bad() ? Error::IoError : Error::EndOfData;
        }
        byte = static_cast<std::uint8_t>(std::istream::traits_type::to_char_type(c));
        return Error::Ok;
    }

    Error read(std::uint8_t* data, std::size_t len, std::size_t& count) {
        in_->read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(len));
        count = static_cast<std::size_t>(in_->gcount());
        if (count < len) {
            return in_->bad() ? Error::IoError : Error::EndOfData;
        }
        return Error::Ok;
    }

private:
    std::istream* in_;
};

/**
 * @brief Byte sink writing to a std::ostream.
 *
 * close() flushes the stream but does not close it; the stream must
 * outlive the sink.
 */
class OstreamSink {
public:
    explicit OstreamSink(std::ostream& out) noexcept : out_(&out) {}

    Error write_byte(std::uint8_t byte) {
        out_->put(static_cast<char>(byte));
        return out_->good() ? Error::Ok : Error::IoError;
    }

    Error write(const std::uint8_t* data, std::size_t len, std::size_t& count) {
        out_->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        if (!out_->good()) {
            // std::ostream::write does not report how much reached the buffer
            count = 0;
            return Error::IoError;
        }
        count = len;
        return Error::Ok;
    }

    Error close() {
        out_->flush();
        return out_->good() ? Error::Ok : Error::IoError;
    }

private:
    std::ostream* out_;
};

} // namespace bitio

#endif // BITIO_STREAM_HPP
