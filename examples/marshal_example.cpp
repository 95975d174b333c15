#include <cstdint>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

#include <structbin/codec/marshal.hpp>
#include <structbin/utils/hex.hpp>

using namespace structbin::codec;

struct S {
    std::int64_t id{0};
    std::string name;
    bool some_flag{false};

    static constexpr auto binary_fields() {
        return std::make_tuple(field("Id", &S::id), field("Name", &S::name), field("SomeFlag", &S::some_flag));
    }
};

static std::ostream &operator<<(std::ostream &os, const S &s) {
    return os << "{" << s.id << " " << s.name << " " << std::boolalpha << s.some_flag << "}";
}

int main() {
    std::cout << "=== 一次性编解码示例 ===\n\n";

    const S data{1, "some Name", true};

    std::vector<structbin::core::byte> encoded;
    auto ec = marshal(data, encoded);
    if (ec) {
        std::cerr << "编码失败: " << ec.message() << "\n";
        return 1;
    }

    S decoded;
    std::size_t consumed = 0;
    ec = unmarshal(encoded, &decoded, consumed);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "parsed " << consumed << " bytes of " << encoded.size() << "\n";
    std::cout << "original data: " << data << "\n";
    std::cout << "hex: " << structbin::utils::to_hex(encoded) << "\n";
    std::cout << "unmarshaled: " << decoded << "\n\n";

    std::cout << structbin::utils::hex_dump(encoded, structbin::utils::HexDumpOptions{.show_ascii = true});
    return 0;
}
