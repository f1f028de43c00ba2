//=============================================================================
// Stream reader unit tests
//
// Macro inlining, op keys, version checks and error latching.
//=============================================================================

#include <boost/ut.hpp>

#include "../common/stream.h"
#include <algorithm>
#include <weft/ops/byte-order.h>
#include <weft/ops/recorder.h>
#include <weft/paint/paint-ops.h>
#include <weft/ui-ops.h>

using namespace boost::ut;
using namespace weft;
using namespace weft::test;

static Result<MacroOp> recordSquare(Ops& ops) {
    MacroRecorder rec;
    WEFT_CHECK(rec.record(ops), "record");
    WEFT_CHECK(paint::ColorOp{{0xff, 0, 0, 0xff}}.add(ops), "color");
    WEFT_CHECK(paint::PaintOp{{{0, 0}, {5, 5}}}.add(ops), "paint");
    return rec.stop();
}

suite reader_stream_tests = [] {
    "empty buffer decodes to end of stream"_test = [] {
        auto ops = newOps();
        auto records = decodeAll(ops);
        expect(records.has_value());
        expect(records->empty());
    };

    "plain ops decode in write order with their keys"_test = [] {
        auto ops = newOps();
        expect(LayerOp{}.add(*ops).has_value());
        expect(paint::ColorOp{{1, 2, 3, 4}}.add(*ops).has_value());

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        expect(types(*records) == std::vector<OpType>{OpType::Layer, OpType::Color});
        expect((*records)[0].key == OpKey{ops->id(), 0, 0});
        expect((*records)[1].key == OpKey{ops->id(), LayerSize, 0});
        expect((*records)[1].data.size() == ColorSize);
    };

    "definitions are skipped and invocations inlined"_test = [] {
        auto ops = newOps();
        auto square = recordSquare(*ops);
        expect(square.has_value());
        expect(square->add(*ops).has_value());
        expect(LayerOp{}.add(*ops).has_value());
        expect(square->add(*ops).has_value());

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        expect(types(*records) == std::vector<OpType>{OpType::Color, OpType::Paint,
                                                      OpType::Layer, OpType::Color,
                                                      OpType::Paint});
        for (const auto& r : *records) {
            expect(r.type != OpType::Macro);
            expect(r.type != OpType::MacroDef);
        }
    };

    "every invocation yields the same keys"_test = [] {
        auto ops = newOps();
        auto square = recordSquare(*ops);
        expect(square.has_value());
        expect(square->add(*ops).has_value());
        expect(square->add(*ops).has_value());

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        expect(records->size() == 4_u);
        expect((*records)[0].key == (*records)[2].key);
        expect((*records)[1].key == (*records)[3].key);
        expect((*records)[0].key.pc == static_cast<uint32_t>(MacroDefSize));
        expect((*records)[0].key != (*records)[1].key);
    };

    "decoding twice yields identical streams"_test = [] {
        auto ops = newOps();
        auto square = recordSquare(*ops);
        expect(square.has_value());
        expect(square->add(*ops).has_value());
        expect(paint::PaintOp{{{1, 1}, {2, 2}}}.add(*ops).has_value());

        auto first = decodeAll(ops);
        auto second = decodeAll(ops);
        expect(first.has_value() && second.has_value());
        if (!first || !second) return;
        expect(first->size() == second->size());
        for (size_t i = 0; i < std::min(first->size(), second->size()); ++i) {
            expect((*first)[i].key == (*second)[i].key);
            expect((*first)[i].data == (*second)[i].data);
        }
    };

    "nested recordings replay the inner macro inside the outer one"_test = [] {
        auto ops = newOps();
        MacroRecorder outer;
        expect(outer.record(*ops).has_value());
        auto inner = recordSquare(*ops);
        expect(inner.has_value());
        expect(inner->add(*ops).has_value());
        expect(inner->add(*ops).has_value());
        auto outerMacro = outer.stop();
        expect(outerMacro.has_value());

        expect(outerMacro->add(*ops).has_value());
        expect(outerMacro->add(*ops).has_value());

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        // two outer invocations, each replaying the inner square twice
        expect(records->size() == 8_u);
        for (size_t i = 0; i < records->size(); i += 2) {
            expect((*records)[i].type == OpType::Color);
            expect((*records)[i + 1].type == OpType::Paint);
            expect((*records)[i].key == (*records)[0].key);
        }
    };

    "ops from another buffer keep the source identity"_test = [] {
        auto source = newOps();
        auto target = newOps();
        auto square = recordSquare(*source);
        expect(square.has_value());
        expect(LayerOp{}.add(*target).has_value());
        expect(square->add(*target).has_value());

        auto records = decodeAll(target);
        expect(records.has_value());
        if (!records) return;
        expect(records->size() == 3_u);
        expect((*records)[0].key.ops == target->id());
        expect((*records)[1].key.ops == source->id());
        expect((*records)[2].key.ops == source->id());
    };

    "a buffer may replay its own macro with refs"_test = [] {
        auto ops = newOps();
        auto image = paint::Image::create(2, 2, std::vector<uint8_t>(16, 0xff));
        expect(image.has_value());

        MacroRecorder rec;
        expect(rec.record(*ops).has_value());
        expect(paint::ImageOp::fromImage(*image).add(*ops).has_value());
        auto macro = rec.stop();
        expect(macro.has_value());
        expect(macro->add(*ops).has_value());

        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        expect(records->size() == 1_u);
        expect((*records)[0].type == OpType::Image);
        expect((*records)[0].refs == 2_u);
    };
};

suite reader_error_tests = [] {
    "decode before reset fails"_test = [] {
        Reader reader;
        expect(!reader.decode().has_value());
    };

    "reset rejects a null buffer"_test = [] {
        Reader reader;
        expect(!reader.reset(nullptr).has_value());
    };

    "reset rejects open recordings"_test = [] {
        auto ops = newOps();
        auto id = ops->record();
        expect(id.has_value());
        Reader reader;
        expect(!reader.reset(ops).has_value());
        expect(ops->stop(*id).has_value());
        expect(reader.reset(ops).has_value());
    };

    "invocation of a reset source fails at decode"_test = [] {
        auto source = newOps();
        auto target = newOps();
        auto square = recordSquare(*source);
        expect(square.has_value());
        expect(square->add(*target).has_value());

        source->reset();
        Reader reader;
        expect(reader.reset(target).has_value());
        auto next = reader.decode();
        expect(!next.has_value());
        // the failure is latched until the next reset
        expect(!reader.decode().has_value());
    };

    "invocation of a destroyed source fails at decode"_test = [] {
        auto target = newOps();
        {
            auto source = newOps();
            auto square = recordSquare(*source);
            expect(square.has_value());
            expect(square->add(*target).has_value());
        }
        auto records = decodeAll(target);
        expect(!records.has_value());
    };

    "reset clears a latched failure"_test = [] {
        auto source = newOps();
        auto target = newOps();
        auto square = recordSquare(*source);
        expect(square.has_value());
        expect(square->add(*target).has_value());
        source->reset();

        Reader reader;
        expect(reader.reset(target).has_value());
        expect(!reader.decode().has_value());

        auto good = newOps();
        expect(LayerOp{}.add(*good).has_value());
        expect(reader.reset(good).has_value());
        auto next = reader.decode();
        expect(next.has_value());
        expect(next.has_value() && next->has_value());
    };

    "invocation whose refs fall short of the macro end fails"_test = [] {
        auto source = newOps();
        auto image = paint::Image::create(1, 1, std::vector<uint8_t>(4, 0xff));
        expect(image.has_value());
        if (!image) return;
        expect(paint::ImageOp::fromImage(*image).add(*source).has_value());
        Pc start = source->pc();
        expect(start.refs == 2_u);
        expect(recordSquare(*source).has_value());
        // a trailing op right after the definition must never be reached
        expect(paint::PaintOp{{{9, 9}, {10, 10}}}.add(*source).has_value());

        // hand-encoded invocation that enters the definition at ref 0
        uint8_t op[MacroSize];
        op[0] = static_cast<uint8_t>(OpType::Macro);
        bo::putU32(op + 1, start.data);
        bo::putU32(op + 5, 0);
        bo::putU32(op + 9, source->version());
        auto target = newOps();
        expect(target->write(op, {Ref(std::weak_ptr<const Ops>(source))}).has_value());

        Reader reader;
        expect(reader.reset(target).has_value());
        expect(reader.decode().has_value());
        expect(reader.decode().has_value());
        // the cursor reaches the end offset with refs 0 instead of 2
        expect(!reader.decode().has_value());
    };

    "truncated payload is rejected"_test = [] {
        auto ops = newOps();
        std::vector<uint8_t> op(1 + 8, 0);
        op[0] = static_cast<uint8_t>(OpType::Aux);
        expect(ops->write(op).has_value());
        // corrupt the length so the chunk claims more bytes than remain
        auto d = ops->data();
        bo::putU32(const_cast<uint8_t*>(d.data()) + 1, 64);
        auto records = decodeAll(ops);
        expect(!records.has_value());
    };
};
