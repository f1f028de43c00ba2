//=============================================================================
// Stack layout unit tests
//=============================================================================

#include <boost/ut.hpp>

#include <weft/layout/stack.h>
#include <weft/paint/painter.h>

using namespace boost::ut;
using namespace weft;
using namespace weft::layout;

namespace {

Ops::Ptr newOps() {
    auto ops = Ops::create();
    return ops ? *ops : nullptr;
}

Result<void> fill(Ops& ops, IPoint size) {
    WEFT_CHECK(paint::ColorOp{{0xff, 0xff, 0xff, 0xff}}.add(ops), "color");
    return paint::PaintOp{{{0, 0}, {float(size.x), float(size.y)}}}.add(ops);
}

// Lays out a 100x60 child and a 20x10 child with the given alignment.
Result<Dimensions> twoChildren(Ops& ops, Direction alignment) {
    Stack stack;
    stack.alignment = alignment;
    stack.init(ops, Constraints::exact({200, 200}).loose());

    auto cs = stack.rigid();
    if (!cs) return Err<Dimensions>("rigid", cs);
    WEFT_CHECK(fill(ops, {100, 60}), "big");
    auto big = stack.end({{100, 60}, 60});
    if (!big) return Err<Dimensions>("end", big);

    cs = stack.rigid();
    if (!cs) return Err<Dimensions>("rigid", cs);
    WEFT_CHECK(fill(ops, {20, 10}), "small");
    auto small = stack.end({{20, 10}, 10});
    if (!small) return Err<Dimensions>("end", small);

    return stack.layout({*big, *small});
}

std::vector<f32::Rect> painted(const Ops::Ptr& ops) {
    paint::Painter painter({400, 400});
    std::vector<f32::Rect> out;
    if (!painter.collect(ops)) return out;
    for (const auto& cmd : painter.drawList().commands) out.push_back(cmd.rect);
    return out;
}

} // namespace

suite stack_layout_tests = [] {
    "stack takes the size of its biggest child"_test = [] {
        auto ops = newOps();
        auto dims = twoChildren(*ops, Direction::NW);
        expect(dims.has_value());
        if (!dims) return;
        expect(dims->size == IPoint{100, 60});
        expect(dims->baseline == 60_i);
    };

    "children are recorded once and placed by invocation"_test = [] {
        auto ops = newOps();
        expect(twoChildren(*ops, Direction::NW).has_value());
        auto rects = painted(ops);
        expect(rects.size() == 2_u);
        if (rects.size() != 2) return;
        expect(rects[0] == f32::Rect{{0, 0}, {100, 60}});
        expect(rects[1] == f32::Rect{{0, 0}, {20, 10}});
    };

    "center alignment"_test = [] {
        auto ops = newOps();
        expect(twoChildren(*ops, Direction::Center).has_value());
        auto rects = painted(ops);
        expect(rects.size() == 2_u);
        if (rects.size() != 2) return;
        expect(rects[1] == f32::Rect{{40, 25}, {60, 35}});
    };

    "south east alignment"_test = [] {
        auto ops = newOps();
        expect(twoChildren(*ops, Direction::SE).has_value());
        auto rects = painted(ops);
        expect(rects.size() == 2_u);
        if (rects.size() != 2) return;
        expect(rects[1] == f32::Rect{{80, 50}, {100, 60}});
    };

    "expanded child gets the size of the stack so far"_test = [] {
        auto ops = newOps();
        Stack stack;
        stack.init(*ops, Constraints::exact({200, 200}).loose());
        expect(stack.rigid().has_value());
        auto first = stack.end({{50, 30}, 30});
        expect(first.has_value());

        auto cs = stack.expand();
        expect(cs.has_value());
        if (!cs) return;
        expect(cs->width.min == 50_i && cs->width.max == 50_i);
        expect(cs->height.min == 30_i && cs->height.max == 30_i);
        expect(stack.end({{50, 30}, 30}).has_value());
    };

    "baseline comes from the first child with its own"_test = [] {
        auto ops = newOps();
        Stack stack;
        stack.init(*ops, Constraints::exact({200, 200}));
        expect(stack.rigid().has_value());
        auto a = stack.end({{40, 40}, 40});
        expect(stack.rigid().has_value());
        auto b = stack.end({{40, 20}, 15});
        expect(a.has_value() && b.has_value());
        if (!a || !b) return;
        auto dims = stack.layout({*a, *b});
        expect(dims.has_value());
        expect(dims.has_value() && dims->baseline == 15_i);
    };

    "stack leaves the scope depth balanced"_test = [] {
        auto ops = newOps();
        expect(twoChildren(*ops, Direction::Center).has_value());
        expect(ops->scopeDepth() == 0_u);
        expect(ops->openRecordings() == 0_u);
    };
};

suite stack_error_tests = [] {
    "child before init fails"_test = [] {
        Stack stack;
        expect(!stack.rigid().has_value());
        expect(!stack.layout({}).has_value());
    };

    "overlapping children fail"_test = [] {
        auto ops = newOps();
        Stack stack;
        stack.init(*ops, Constraints::exact({10, 10}));
        expect(stack.rigid().has_value());
        expect(!stack.rigid().has_value());
        expect(stack.end({{1, 1}, 1}).has_value());
    };

    "end without a child fails"_test = [] {
        auto ops = newOps();
        Stack stack;
        stack.init(*ops, Constraints::exact({10, 10}));
        expect(!stack.end({}).has_value());
    };

    "children from a previous frame are rejected"_test = [] {
        auto ops = newOps();
        Stack stack;
        stack.init(*ops, Constraints::exact({10, 10}));
        expect(stack.rigid().has_value());
        auto child = stack.end({{5, 5}, 5});
        expect(child.has_value());
        if (!child) return;

        ops->reset();
        stack.init(*ops, Constraints::exact({10, 10}));
        expect(!stack.layout({*child}).has_value());
    };
};
