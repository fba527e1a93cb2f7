/**
 * @file bitio.hpp
 * @brief bitio umbrella header.
 *
 * Pulls in the bit reader, bit writer and the stream adapters.
 *
 * @par Example
 * @code
 * bitio::BitWriter writer(bitio::VectorSink{});
 * writer.write_bits(0x5, 3);
 * writer.write_byte(0xAC);
 * writer.close();
 *
 * bitio::BitReader reader(bitio::MemorySource(writer.sink().bytes()));
 * std::uint64_t value = 0;
 * reader.read_bits(3, value); // 0x5
 * @endcode
 */

#ifndef BITIO_HPP
#define BITIO_HPP

#include "bitreader.hpp"
#include "bitwriter.hpp"
#include "config.hpp"
#include "error.hpp"
#include "stream.hpp"

#endif // BITIO_HPP
