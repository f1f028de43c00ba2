//=============================================================================
// Decoded op unit tests
//
// Typed decoding of reader output and the one line descriptions weft-dump
// prints.
//=============================================================================

#include <boost/ut.hpp>

#include "../common/stream.h"
#include <weft/decoded-op.h>
#include <weft/ops/recorder.h>

using namespace boost::ut;
using namespace weft;
using namespace weft::test;

static Result<std::vector<std::string>> describeAll(const Ops::ConstPtr& ops) {
    Reader reader;
    WEFT_CHECK(reader.reset(ops), "reset");
    std::vector<std::string> lines;
    for (;;) {
        auto next = reader.decode();
        if (!next) return Err<std::vector<std::string>>("decode", next);
        if (!*next) break;
        auto op = decodeOp(**next);
        if (!op) return Err<std::vector<std::string>>("decodeOp", op);
        lines.push_back(describe(*op));
    }
    return Ok(std::move(lines));
}

suite decoded_op_tests = [] {
    "replayed macro decodes to its recorded ops"_test = [] {
        auto ops = newOps();
        MacroRecorder rec;
        expect(rec.record(*ops).has_value());
        expect(paint::ColorOp{{0xff, 0, 0, 0xff}}.add(*ops).has_value());
        expect(paint::PaintOp{{{0, 0}, {5, 5}}}.add(*ops).has_value());
        auto macro = rec.stop();
        expect(macro.has_value());
        if (!macro) return;

        StackOp stack;
        expect(stack.push(*ops).has_value());
        expect(TransformOp{Transform::offset({10, 0})}.add(*ops).has_value());
        expect(macro->add(*ops).has_value());
        expect(stack.pop().has_value());

        auto lines = describeAll(ops);
        expect(lines.has_value());
        if (!lines) return;
        std::vector<std::string> want = {
            "Push",
            "Transform offset=(10,0)",
            "Color rgba=(255,0,0,255)",
            "Paint rect=(0,0)-(5,5)",
            "Pop",
        };
        expect(*lines == want);
    };

    "handler ops name their tag"_test = [] {
        auto ops = newOps();
        auto tag = input::Tag::create("field");
        expect(tag.has_value());
        if (!tag) return;
        expect((input::KeyHandlerOp{*tag, true}).add(*ops).has_value());
        expect(input::HideInputOp{}.add(*ops).has_value());

        auto lines = describeAll(ops);
        expect(lines.has_value());
        if (!lines || lines->size() != 2) return;
        expect((*lines)[0] == "KeyHandler tag=" + std::to_string((*tag)->id()) + " focus=true");
        expect((*lines)[1] == "HideInput");
    };

    "typed values survive decoding"_test = [] {
        auto ops = newOps();
        expect(paint::ClipOp{{{1, 2}, {3, 4}}}.add(*ops).has_value());
        Reader reader;
        expect(reader.reset(ops).has_value());
        auto next = reader.decode();
        expect(next.has_value() && next->has_value());
        if (!next || !*next) return;
        auto op = decodeOp(**next);
        expect(op.has_value());
        if (!op) return;
        const auto* clip = std::get_if<paint::ClipOp>(&*op);
        expect(clip != nullptr);
        if (!clip) return;
        expect(clip->bounds == f32::Rect{{1, 2}, {3, 4}});
    };
};
