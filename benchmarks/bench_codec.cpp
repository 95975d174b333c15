#include "bench_main.hpp"
#include "structbin/codec/marshal.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

using namespace structbin;
using namespace structbin::codec;
using namespace structbin::core;

namespace {

struct Sample {
    std::uint64_t timestamp{0};
    std::string channel;
    std::vector<double> values;
    std::unique_ptr<std::string> note;

    static constexpr auto binary_fields() {
        return std::make_tuple(field("Timestamp", &Sample::timestamp),
                               field("Channel", &Sample::channel),
                               field("Values", &Sample::values),
                               field("Note", &Sample::note));
    }
};

std::vector<Sample> make_samples(std::size_t count) {
    std::vector<Sample> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        Sample s;
        s.timestamp = 1'700'000'000'000ull + i;
        s.channel = "sensor-" + std::to_string(i % 16);
        s.values.assign(8, static_cast<double>(i) * 0.5);
        s.note = std::make_unique<std::string>("ok");
        out.push_back(std::move(s));
    }
    return out;
}

void bench_scalar_slice() {
    constexpr std::size_t count = 1 << 20;
    const std::vector<std::uint32_t> values(count, 0xA5A5A5A5u);

    std::vector<byte> encoded;
    encoded.reserve(count * sizeof(std::uint32_t) + kLengthPrefixBytes);

    BENCH_RUN("structbin: encode []uint32 (1M elements)", count * sizeof(std::uint32_t), 5, {
        encoded.clear();
        auto ec = marshal(values, encoded);
        if (ec) {
            std::cerr << "Encode failed: " << ec.message() << "\n";
        }
    });

    BENCH_RUN("structbin: decode []uint32 (1M elements)", encoded.size(), 5, {
        std::vector<std::uint32_t> decoded;
        std::size_t consumed = 0;
        auto ec = unmarshal(encoded, &decoded, consumed);
        if (ec) {
            std::cerr << "Decode failed: " << ec.message() << "\n";
        }
    });
}

void bench_struct_records() {
    constexpr std::size_t count = 10'000;
    const auto samples = make_samples(count);

    std::vector<byte> encoded;
    BENCH_RUN("structbin: encode struct records (10k)", count, 5, {
        encoded.clear();
        auto ec = marshal(samples, encoded);
        if (ec) {
            std::cerr << "Encode failed: " << ec.message() << "\n";
        }
    });

    BENCH_RUN("structbin: decode struct records (10k)", encoded.size(), 5, {
        std::vector<Sample> decoded;
        std::size_t consumed = 0;
        auto ec = unmarshal(encoded, &decoded, consumed);
        if (ec) {
            std::cerr << "Decode failed: " << ec.message() << "\n";
        }
    });
}

void bench_string_map() {
    std::map<std::string, std::string> m;
    for (int i = 0; i < 5000; ++i) {
        m.emplace("key-" + std::to_string(i), std::string(32, static_cast<char>('a' + i % 26)));
    }

    std::vector<byte> encoded;
    BENCH_RUN("structbin: encode map[string]string (5k)", m.size(), 5, {
        encoded.clear();
        auto ec = marshal(m, encoded);
        if (ec) {
            std::cerr << "Encode failed: " << ec.message() << "\n";
        }
    });

    BENCH_RUN("structbin: decode map[string]string (5k)", encoded.size(), 5, {
        std::map<std::string, std::string> decoded;
        std::size_t consumed = 0;
        auto ec = unmarshal(encoded, &decoded, consumed);
        if (ec) {
            std::cerr << "Decode failed: " << ec.message() << "\n";
        }
    });
}

} // namespace

int main() {
    std::cout << "Running structbin codec benchmarks...\n";

    bench_scalar_slice();
    bench_struct_records();
    bench_string_map();

    ::structbin::benchmarks::print_results();
    return 0;
}
