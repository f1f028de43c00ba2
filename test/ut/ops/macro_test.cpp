//=============================================================================
// Macro recorder and scope guard unit tests
//=============================================================================

#include <boost/ut.hpp>

#include "../common/stream.h"
#include <weft/ops/byte-order.h>
#include <weft/ops/recorder.h>
#include <weft/paint/paint-ops.h>

using namespace boost::ut;
using namespace weft;
using namespace weft::test;

static Result<void> addPaint(Ops& ops, float x) {
    return paint::PaintOp{{{x, 0}, {x + 1, 1}}}.add(ops);
}

suite macro_header_tests = [] {
    "record reserves a header and stop patches it"_test = [] {
        auto ops = newOps();
        auto id = ops->record();
        expect(id.has_value());
        expect(ops->data().size() == MacroDefSize);
        expect(ops->data()[0] == static_cast<uint8_t>(OpType::MacroDef));

        expect(addPaint(*ops, 0).has_value());
        auto macro = ops->stop(*id);
        expect(macro.has_value());

        auto d = ops->data();
        expect(d.size() == MacroDefSize + PaintSize);
        expect(bo::getU32(d.data() + 1) == static_cast<uint32_t>(d.size()));
        expect(bo::getU32(d.data() + 5) == 0_u);
        expect(macro->pc() == Pc{0, 0});
        expect(macro->version() == 0_u);
        expect(!macro->empty());
    };

    "header is patched in place, never re-appended"_test = [] {
        auto ops = newOps();
        auto id = ops->record();
        expect(id.has_value());
        auto before = ops->data().size();
        auto macro = ops->stop(*id);
        expect(macro.has_value());
        expect(ops->data().size() == before);
    };

    "invocation is one 13 byte record with one reference"_test = [] {
        auto ops = newOps();
        MacroRecorder rec;
        expect(rec.record(*ops).has_value());
        expect(addPaint(*ops, 0).has_value());
        auto macro = rec.stop();
        expect(macro.has_value());

        auto before = ops->pc();
        expect(macro->add(*ops).has_value());
        auto after = ops->pc();
        expect(after.data - before.data == MacroSize);
        expect(after.refs - before.refs == 1_u);
        expect(ops->data()[before.data] == static_cast<uint8_t>(OpType::Macro));
    };
};

suite macro_balance_tests = [] {
    "stop without record fails"_test = [] {
        auto ops = newOps();
        expect(!ops->stop(1).has_value());
    };

    "stopping an outer recording while an inner one is open fails"_test = [] {
        auto ops = newOps();
        auto outer = ops->record();
        auto inner = ops->record();
        expect(outer.has_value() && inner.has_value());

        expect(!ops->stop(*outer).has_value());
        expect(ops->openRecordings() == 2_u);

        expect(ops->stop(*inner).has_value());
        expect(ops->stop(*outer).has_value());
        expect(ops->openRecordings() == 0_u);
    };

    "a recording cannot be stopped twice"_test = [] {
        auto ops = newOps();
        auto id = ops->record();
        expect(id.has_value());
        expect(ops->stop(*id).has_value());
        expect(!ops->stop(*id).has_value());
    };

    "recorder rejects double record and stray stop"_test = [] {
        auto ops = newOps();
        MacroRecorder rec;
        expect(!rec.stop().has_value());
        expect(rec.record(*ops).has_value());
        expect(rec.recording());
        expect(!rec.record(*ops).has_value());
        expect(rec.stop().has_value());
        expect(!rec.recording());
        // reusable after stop
        expect(rec.record(*ops).has_value());
        expect(rec.stop().has_value());
    };

    "sibling recorders must stop innermost first"_test = [] {
        auto ops = newOps();
        MacroRecorder a;
        MacroRecorder b;
        expect(a.record(*ops).has_value());
        expect(b.record(*ops).has_value());
        expect(!a.stop().has_value());
        expect(a.recording());
        expect(b.stop().has_value());
        expect(a.stop().has_value());
    };
};

suite macro_handle_tests = [] {
    "empty handle adds nothing"_test = [] {
        auto ops = newOps();
        MacroOp empty;
        expect(empty.empty());
        expect(empty.add(*ops).has_value());
        expect(ops->data().empty());
    };

    "stale handle is rejected after reset"_test = [] {
        auto ops = newOps();
        MacroRecorder rec;
        expect(rec.record(*ops).has_value());
        expect(addPaint(*ops, 0).has_value());
        auto macro = rec.stop();
        expect(macro.has_value());

        ops->reset();
        expect(!macro->add(*ops).has_value());
        expect(ops->data().empty());
    };

    "handle of a destroyed buffer is rejected"_test = [] {
        MacroOp macro;
        {
            auto source = newOps();
            auto id = source->record();
            expect(id.has_value());
            auto m = source->stop(*id);
            expect(m.has_value());
            macro = *m;
        }
        auto target = newOps();
        expect(!macro.add(*target).has_value());
        expect(macro.ops() == nullptr);
    };

    "handle may be added to another buffer"_test = [] {
        auto source = newOps();
        auto target = newOps();
        auto id = source->record();
        expect(id.has_value());
        expect(addPaint(*source, 0).has_value());
        auto macro = source->stop(*id);
        expect(macro.has_value());
        expect(macro->add(*target).has_value());
        expect(target->refs().size() == 1_u);
        expect(macro->ops() == source);
    };
};

suite stack_op_tests = [] {
    "push and pop write scope markers"_test = [] {
        auto ops = newOps();
        StackOp stack;
        expect(stack.push(*ops).has_value());
        expect(ops->scopeDepth() == 1_u);
        expect(stack.pop().has_value());
        expect(ops->scopeDepth() == 0_u);
        auto d = ops->data();
        expect(d.size() == 2_u);
        expect(d[0] == static_cast<uint8_t>(OpType::Push));
        expect(d[1] == static_cast<uint8_t>(OpType::Pop));
    };

    "pop without push fails"_test = [] {
        StackOp stack;
        expect(!stack.pop().has_value());
    };

    "pops are LIFO"_test = [] {
        auto ops = newOps();
        StackOp outer;
        StackOp inner;
        expect(outer.push(*ops).has_value());
        expect(inner.push(*ops).has_value());
        expect(!outer.pop().has_value());
        expect(inner.pop().has_value());
        expect(outer.pop().has_value());
        expect(ops->data().size() == 4_u);
    };

    "pop may not cross a macro boundary"_test = [] {
        auto ops = newOps();
        StackOp stack;
        expect(stack.push(*ops).has_value());
        auto id = ops->record();
        expect(id.has_value());
        expect(!stack.pop().has_value());
        expect(ops->stop(*id).has_value());
        expect(stack.pop().has_value());
    };

    "stop with an open scope fails"_test = [] {
        auto ops = newOps();
        MacroRecorder rec;
        expect(rec.record(*ops).has_value());
        StackOp stack;
        expect(stack.push(*ops).has_value());
        auto size = ops->data().size();
        expect(!rec.stop().has_value());
        // the failed stop left the recording and the header untouched
        expect(ops->openRecordings() == 1_u);
        expect(ops->data().size() == size);
        expect(bo::getU32(ops->data().data() + 1) == static_cast<uint32_t>(MacroDefSize));

        expect(stack.pop().has_value());
        auto macro = rec.stop();
        expect(macro.has_value());
        expect(ops->scopeDepth() == 0_u);
        auto records = decodeAll(ops);
        expect(records.has_value());
        if (!records) return;
        expect(types(*records) == std::vector<OpType>{});
    };

    "a scope opened before the recording does not block its stop"_test = [] {
        auto ops = newOps();
        StackOp stack;
        expect(stack.push(*ops).has_value());
        MacroRecorder rec;
        expect(rec.record(*ops).has_value());
        expect(addPaint(*ops, 0).has_value());
        expect(rec.stop().has_value());
        expect(stack.pop().has_value());
    };

    "pop after reset fails"_test = [] {
        auto ops = newOps();
        StackOp stack;
        expect(stack.push(*ops).has_value());
        ops->reset();
        expect(!stack.pop().has_value());
    };
};
