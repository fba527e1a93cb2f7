/**
 * @file test_roundtrip.cpp
 * @brief Write-then-read tests over the whole bitio stack.
 *
 * Values written with BitWriter must come back bit for bit from BitReader,
 * whatever the mix of field widths.
 */

#include <catch2/catch.hpp>
#include <bitio/bitio.hpp>

#include <cstdint>
#include <random>
#include <sstream>
#include <vector>

using namespace bitio;

namespace {

constexpr std::uint64_t SEED = 0x0B17C0DEU;

struct Field {
    std::uint64_t value;
    std::size_t width;
};

std::vector<Field> random_fields(std::size_t count, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::size_t> width_dist(1, MAX_BIT_WIDTH);

    std::vector<Field> fields(count);
    for (auto& f : fields) {
        f.width = width_dist(rng);
        f.value = rng();
        if (f.width < MAX_BIT_WIDTH) {
            f.value &= (std::uint64_t{1} << f.width) - 1U;
        }
    }
    return fields;
}

} // namespace

TEST_CASE("Round trip of random fields", "[roundtrip]") {
    auto fields = random_fields(20000, SEED);

    BitWriter writer(VectorSink{});
    for (const auto& f : fields) {
        REQUIRE(writer.write_bits(f.value, f.width) == Error::Ok);
    }
    REQUIRE(writer.close() == Error::Ok);

    BitReader reader{MemorySource(writer.sink().bytes())};
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        REQUIRE(reader.read_bits(fields[i].width, value) == Error::Ok);
        if (value != fields[i].value) {
            INFO("field " << i << " width " << fields[i].width);
            REQUIRE(value == fields[i].value);
        }
    }

    // Only the zero padding of the final byte is left
    std::uint8_t byte = 0;
    REQUIRE(reader.read_byte(byte) == Error::EndOfData);
}

TEST_CASE("Round trip through iostreams", "[roundtrip]") {
    auto fields = random_fields(2000, SEED + 1);

    std::ostringstream out(std::ios::binary);
    BitWriter writer{OstreamSink(out)};
    for (const auto& f : fields) {
        REQUIRE(writer.write_bits(f.value, f.width) == Error::Ok);
    }
    REQUIRE(writer.close() == Error::Ok);

    std::istringstream in(out.str(), std::ios::binary);
    BitReader reader{IstreamSource(in)};
    std::uint64_t value = 0;
    for (const auto& f : fields) {
        REQUIRE(reader.read_bits(f.width, value) == Error::Ok);
        REQUIRE(value == f.value);
    }
}

TEST_CASE("Round trip of mixed operations", "[roundtrip]") {
    const std::uint8_t block[] = {0xDE, 0xAD, 0xBE, 0xEF};

    BitWriter writer(VectorSink{});
    std::size_t count = 0;
    std::size_t padding = 0;
    REQUIRE(writer.write_bool(true) == Error::Ok);
    REQUIRE(writer.write(block, 4, count) == Error::Ok);
    REQUIRE(writer.write_bits(0x2A, 6) == Error::Ok);
    REQUIRE(writer.write_byte(0x99) == Error::Ok);
    REQUIRE(writer.align(padding) == Error::Ok);
    REQUIRE(padding == 1);
    REQUIRE(writer.write(block, 4, count) == Error::Ok);
    REQUIRE(writer.write_bits(0x123456789ULL, 33) == Error::Ok);
    REQUIRE(writer.close() == Error::Ok);

    // 1 + 32 + 6 + 8 + 1 padding + 32 + 33 bits, rounded up
    REQUIRE(writer.sink().bytes().size() == 15);

    BitReader reader{MemorySource(writer.sink().bytes())};
    std::uint8_t buf[4] = {0, 0, 0, 0};
    bool bit = false;
    std::uint8_t byte = 0;
    std::uint64_t value = 0;

    REQUIRE(reader.read_bool(bit) == Error::Ok);
    REQUIRE(bit == true);
    REQUIRE(reader.read(buf, 4, count) == Error::Ok);
    REQUIRE(std::vector<std::uint8_t>(buf, buf + 4) ==
            std::vector<std::uint8_t>(block, block + 4));
    REQUIRE(reader.read_bits(6, value) == Error::Ok);
    REQUIRE(value == 0x2A);
    REQUIRE(reader.read_byte(byte) == Error::Ok);
    REQUIRE(byte == 0x99);
    REQUIRE(reader.align() == 1);
    REQUIRE(reader.read(buf, 4, count) == Error::Ok);
    REQUIRE(buf[0] == 0xDE);
    REQUIRE(buf[3] == 0xEF);
    REQUIRE(reader.read_bits(33, value) == Error::Ok);
    REQUIRE(value == 0x123456789ULL);
}

TEST_CASE("Literal MSB-first layout reads back", "[roundtrip]") {
    const std::vector<std::uint8_t> bytes = {0xC1, 0x7F, 0xAC, 0x89, 0x24, 0x78, 0x01,
                                             0x02, 0xF8, 0x08, 0xF0, 0xFF, 0x80};
    BitReader reader{MemorySource(bytes)};
    std::uint64_t value = 0;
    std::uint8_t byte = 0;
    bool bit = true;

    REQUIRE(reader.read_byte(byte) == Error::Ok);
    REQUIRE(byte == 0xC1);
    REQUIRE(reader.read_bool(bit) == Error::Ok);
    REQUIRE(bit == false);
    REQUIRE(reader.read_bits(6, value) == Error::Ok);
    REQUIRE(value == 0x3F);
    REQUIRE(reader.read_bool(bit) == Error::Ok);
    REQUIRE(bit == true);
    REQUIRE(reader.read_byte(byte) == Error::Ok);
    REQUIRE(byte == 0xAC);
    REQUIRE(reader.read_bits(1, value) == Error::Ok);
    REQUIRE(value == 0x1);
    REQUIRE(reader.read_bits(20, value) == Error::Ok);
    REQUIRE(value == 0x1248F);
    REQUIRE(reader.align() == 3);
}
