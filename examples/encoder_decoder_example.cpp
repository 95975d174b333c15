#include <cstdint>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

#include <structbin/codec/decoder.hpp>
#include <structbin/codec/encoder.hpp>
#include <structbin/core/log.hpp>

using namespace structbin::codec;

struct S {
    std::int64_t id{0};
    std::string name;
    bool some_flag{false};

    // "" 或 "-" 的字段在 only_tagged 模式下被忽略
    static constexpr auto binary_fields() {
        return std::make_tuple(field("Id", &S::id, R"(someTag:"+")"),
                               field("Name", &S::name, R"(someTag:"aaaaaa")"),
                               field("SomeFlag", &S::some_flag, R"(someTag:"-")"));
    }
};

static std::ostream &operator<<(std::ostream &os, const S &s) {
    return os << "{" << s.id << " " << s.name << " " << std::boolalpha << s.some_flag << "}";
}

int main() {
    // 打开 debug 日志，可以看到解码末尾的补 0 记录
    structbin::core::set_log_level(structbin::core::LogLevel::debug);

    const S data{1, "some Name", true};

    std::vector<structbin::core::byte> buffer;
    buffer.reserve(256);
    structbin::core::VectorSink sink(buffer);
    Encoder enc(sink, "someTag", true);
    if (auto ec = enc.encode(data)) {
        std::cerr << "编码失败: " << ec.message() << "\n";
        return 1;
    }

    // 默认配置解码：SomeFlag 没有被写出，读到末尾后补 0
    S unmarshaled;
    structbin::core::BytesSource source(buffer);
    Decoder dec(source);
    if (auto ec = dec.decode(&unmarshaled)) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "original data: " << data << "\n";
    std::cout << "after unmarshaling: " << unmarshaled << "\n";
    return 0;
}
