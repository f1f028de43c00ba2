#pragma once

#include <weft/layout/layout.h>
#include <weft/ops/recorder.h>
#include <initializer_list>

namespace weft {
namespace layout {

// Recorded child of a Stack, ready to be placed.
struct StackChild {
    MacroOp macro;
    Dimensions dims;
};

//=============================================================================
// Stack - lays out children on top of each other
//
//   Stack stack;
//   stack.init(ops, cs);
//   auto cs1 = stack.rigid();    // starts recording child 1
//   ... child 1 writes its ops ...
//   auto c1 = stack.end(dims1);
//   auto cs2 = stack.expand();   // constraints of the biggest child so far
//   ... child 2 ...
//   auto c2 = stack.end(dims2);
//   auto dims = stack.layout({*c1, *c2});
//
// Children smaller than the stack are placed according to alignment.
//=============================================================================
class Stack {
public:
    Direction alignment = Direction::NW;

    void init(Ops& ops, const Constraints& cs);

    Result<Constraints> rigid();
    Result<Constraints> expand();
    Result<StackChild> end(const Dimensions& dims);

    Result<Dimensions> layout(std::initializer_list<StackChild> children);

private:
    Result<void> begin();

    Ops* _ops = nullptr;
    MacroRecorder _recorder;
    Constraints _cs;
    IPoint _maxSize;
    int32_t _baseline = 0;
};

} // namespace layout
} // namespace weft
