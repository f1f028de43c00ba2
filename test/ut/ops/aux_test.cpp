//=============================================================================
// Aux payload channel unit tests
//=============================================================================

#include <boost/ut.hpp>

#include "../common/stream.h"
#include <weft/ops/byte-order.h>
#include <weft/ops/recorder.h>
#include <weft/paint/paint-ops.h>
#include <weft/ui-ops.h>

using namespace boost::ut;
using namespace weft;
using namespace weft::test;

static Result<void> writeAux(Ops& ops, size_t n, uint8_t fill) {
    std::vector<uint8_t> op(1 + n, fill);
    op[0] = static_cast<uint8_t>(OpType::Aux);
    return ops.write(op);
}

suite aux_coalescing_tests = [] {
    "consecutive writes merge into one chunk"_test = [] {
        auto ops = newOps();
        constexpr size_t N = 7;
        constexpr size_t K = 32;
        for (size_t i = 0; i < N; ++i) {
            expect(writeAux(*ops, K, static_cast<uint8_t>(i)).has_value());
        }
        auto d = ops->data();
        expect(d.size() == AuxSize + N * K);
        expect(d[0] == static_cast<uint8_t>(OpType::Aux));
        expect(bo::getU32(d.data() + 1) == static_cast<uint32_t>(N * K));

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        expect(records->size() == 1_u);
        auto aux = AuxOp::decode(EncodedOp{(*records)[0].key, (*records)[0].data, {}});
        expect(aux.has_value());
        expect(aux->payload.size() == N * K);
        expect(aux->payload[K] == 1_u);
        expect(aux->payload[N * K - 1] == static_cast<uint8_t>(N - 1));
    };

    "a non-aux write splits the chunk"_test = [] {
        auto ops = newOps();
        expect(writeAux(*ops, 8, 1).has_value());
        expect(writeAux(*ops, 8, 2).has_value());
        expect(paint::ColorOp{{1, 2, 3, 4}}.add(*ops).has_value());
        expect(writeAux(*ops, 4, 3).has_value());

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        expect(types(*records) ==
               std::vector<OpType>{OpType::Aux, OpType::Color, OpType::Aux});
        expect((*records)[0].data.size() == AuxSize + 16);
        expect((*records)[2].data.size() == AuxSize + 4);
    };

    "length field is consistent while the chunk is open"_test = [] {
        auto ops = newOps();
        expect(writeAux(*ops, 3, 0).has_value());
        expect(bo::getU32(ops->data().data() + 1) == 3_u);
        expect(writeAux(*ops, 5, 0).has_value());
        expect(bo::getU32(ops->data().data() + 1) == 8_u);
    };

    "empty aux payload still opens a chunk"_test = [] {
        auto ops = newOps();
        expect(writeAux(*ops, 0, 0).has_value());
        expect(ops->data().size() == AuxSize);
        expect(ops->aux().empty());
    };
};

suite aux_view_tests = [] {
    "aux exposes the open payload for patching"_test = [] {
        auto ops = newOps();
        expect(ops->aux().empty());
        expect(writeAux(*ops, 4, 0).has_value());
        expect(writeAux(*ops, 4, 0).has_value());
        auto view = ops->aux();
        expect(view.size() == 8_u);
        view[5] = 0xab;
        expect(ops->data()[AuxSize + 5] == 0xab_u);
    };

    "aux is closed by any other write"_test = [] {
        auto ops = newOps();
        expect(writeAux(*ops, 4, 0).has_value());
        expect(LayerOp{}.add(*ops).has_value());
        expect(ops->aux().empty());
    };

    "record and stop close the chunk"_test = [] {
        auto ops = newOps();
        expect(writeAux(*ops, 4, 0).has_value());
        auto id = ops->record();
        expect(id.has_value());
        expect(ops->aux().empty());

        expect(writeAux(*ops, 6, 0).has_value());
        expect(ops->stop(*id).has_value());
        expect(ops->aux().empty());
        expect(writeAux(*ops, 2, 0).has_value());

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        // The recorded chunk is skipped as part of the definition.
        expect(types(*records) == std::vector<OpType>{OpType::Aux, OpType::Aux});
        expect((*records)[0].data.size() == AuxSize + 4);
        expect((*records)[1].data.size() == AuxSize + 2);
    };

    "aux chunk inside a macro replays at the call site"_test = [] {
        auto ops = newOps();
        MacroRecorder rec;
        expect(rec.record(*ops).has_value());
        expect(writeAux(*ops, 16, 9).has_value());
        expect(paint::ClipOp{{{0, 0}, {1, 1}}}.add(*ops).has_value());
        auto macro = rec.stop();
        expect(macro.has_value());
        expect(macro->add(*ops).has_value());

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        expect(types(*records) == std::vector<OpType>{OpType::Aux, OpType::Clip});
        expect((*records)[0].data.size() == AuxSize + 16);
    };
};
