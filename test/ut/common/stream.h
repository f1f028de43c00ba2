#pragma once

// Helpers shared by the unit tests: build buffers and flatten decoded streams.

#include <weft/ops/reader.h>
#include <vector>

namespace weft {
namespace test {

struct DecodedRecord {
    OpType type;
    OpKey key;
    std::vector<uint8_t> data;
    size_t refs = 0;
};

inline Ops::Ptr newOps() {
    auto ops = Ops::create();
    return ops ? *ops : nullptr;
}

inline Result<std::vector<DecodedRecord>> decodeAll(const Ops::ConstPtr& ops) {
    Reader reader;
    if (auto res = reader.reset(ops); !res) {
        return Err<std::vector<DecodedRecord>>("reset", res);
    }
    std::vector<DecodedRecord> out;
    for (;;) {
        auto next = reader.decode();
        if (!next) {
            return Err<std::vector<DecodedRecord>>("decode", next);
        }
        if (!*next) break;
        const auto& op = **next;
        out.push_back({op.type(), op.key, {op.data.begin(), op.data.end()}, op.refs.size()});
    }
    return Ok(std::move(out));
}

inline std::vector<OpType> types(const std::vector<DecodedRecord>& records) {
    std::vector<OpType> out;
    for (const auto& r : records) out.push_back(r.type);
    return out;
}

} // namespace test
} // namespace weft
