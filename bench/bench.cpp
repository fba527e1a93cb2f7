/**
 * @file bench.cpp
 * @brief Performance benchmarks for bitio readers and writers.
 *
 * Measures bit packing and unpacking throughput over in-memory streams for
 * regression testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/bitio_bench              # Run with default 100 iterations
 *   ./build/bitio_bench 1000         # Run with custom iteration count
 */

#include <bitio/bitio.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <vector>

using namespace bitio;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t NUM_FIELDS = 100000;
static constexpr std::uint64_t SEED = 0x5eedb175U;

struct Field {
    std::uint64_t value;
    std::size_t width;
};

/**
 * @brief Generate fields with widths drawn from [min_width, max_width].
 */
static std::vector<Field> make_fields(std::size_t min_width, std::size_t max_width) {
    std::mt19937_64 rng(SEED);
    std::uniform_int_distribution<std::size_t> width_dist(min_width, max_width);

    std::vector<Field> fields(NUM_FIELDS);
    for (auto& f : fields) {
        f.width = width_dist(rng);
        f.value = rng();
        if (f.width < MAX_BIT_WIDTH) {
            f.value &= (std::uint64_t{1} << f.width) - 1U;
        }
    }
    return fields;
}

static std::size_t total_bits(const std::vector<Field>& fields) {
    std::size_t bits = 0;
    for (const auto& f : fields) {
        bits += f.width;
    }
    return bits;
}

static bool pack(const std::vector<Field>& fields, std::vector<std::uint8_t>& out) {
    BitWriter writer(VectorSink((total_bits(fields) + 7) / 8));
    for (const auto& f : fields) {
        if (writer.write_bits(f.value, f.width) != Error::Ok) {
            return false;
        }
    }
    if (writer.close() != Error::Ok) {
        return false;
    }
    out = writer.sink().bytes();
    return true;
}

static bool unpack(const std::vector<Field>& fields, const std::vector<std::uint8_t>& in,
                   std::uint64_t& checksum) {
    BitReader reader{MemorySource(in)};
    std::uint64_t value = 0;
    for (const auto& f : fields) {
        if (reader.read_bits(f.width, value) != Error::Ok) {
            return false;
        }
        checksum ^= value;
    }
    return true;
}

static void report(const char* name, double total_us, int iterations, std::size_t bits) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(bits) / per_iter_us;
    std::printf("%-20s %10.2f µs/iter  %10.1f Mbit/s  (%zu bits)\n", name, per_iter_us,
                throughput_mbps, bits);
}

static bool bench_write(const char* name, const std::vector<Field>& fields, int iterations) {
    std::vector<std::uint8_t> out;

    // Warmup run
    if (!pack(fields, out)) {
        std::fprintf(stderr, "Error: %s: write failed\n", name);
        return false;
    }

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        pack(fields, out);
    }
    auto end = std::chrono::high_resolution_clock::now();

    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           total_bits(fields));
    return true;
}

static bool bench_read(const char* name, const std::vector<Field>& fields, int iterations) {
    std::vector<std::uint8_t> packed;
    if (!pack(fields, packed)) {
        std::fprintf(stderr, "Error: %s: write failed\n", name);
        return false;
    }

    std::uint64_t checksum = 0;

    // Warmup run
    if (!unpack(fields, packed, checksum)) {
        std::fprintf(stderr, "Error: %s: read failed\n", name);
        return false;
    }

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        unpack(fields, packed, checksum);
    }
    auto end = std::chrono::high_resolution_clock::now();

    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           total_bits(fields));
    return true;
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("bitio Benchmarks (v%s)\n", version());
    std::printf("======================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Fields per iteration: %zu\n\n", NUM_FIELDS);

    auto mixed = make_fields(1, MAX_BIT_WIDTH);
    auto narrow = make_fields(1, 7);
    auto bytes = make_fields(8, 8);

    bool ok = true;

    std::printf("Write:\n");
    ok = bench_write("mixed 1-64", mixed, iterations) && ok;
    ok = bench_write("narrow 1-7", narrow, iterations) && ok;
    ok = bench_write("aligned bytes", bytes, iterations) && ok;

    std::printf("\nRead:\n");
    ok = bench_read("mixed 1-64", mixed, iterations) && ok;
    ok = bench_read("narrow 1-7", narrow, iterations) && ok;
    ok = bench_read("aligned bytes", bytes, iterations) && ok;

    return ok ? 0 : 1;
}
