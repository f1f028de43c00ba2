#include <weft/ops/op-type.h>

namespace weft {

static_assert(OpPropsTable.size() == 16, "props table out of sync with OpType");

const char* opTypeName(OpType t) noexcept {
    switch (t) {
        case OpType::MacroDef: return "MacroDef";
        case OpType::Macro: return "Macro";
        case OpType::Transform: return "Transform";
        case OpType::Layer: return "Layer";
        case OpType::Invalidate: return "Invalidate";
        case OpType::Image: return "Image";
        case OpType::Color: return "Color";
        case OpType::Paint: return "Paint";
        case OpType::Clip: return "Clip";
        case OpType::Area: return "Area";
        case OpType::PointerHandler: return "PointerHandler";
        case OpType::KeyHandler: return "KeyHandler";
        case OpType::HideInput: return "HideInput";
        case OpType::Push: return "Push";
        case OpType::Pop: return "Pop";
        case OpType::Aux: return "Aux";
    }
    return "Unknown";
}

} // namespace weft
