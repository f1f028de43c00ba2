#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace weft {

//=============================================================================
// OpType - closed set of operation kinds
//
// Tags start at 200 so raw dumps are easy to tell apart from payload bytes.
//=============================================================================
enum class OpType : uint8_t {
    MacroDef = 200,
    Macro,
    Transform,
    Layer,
    Invalidate,
    Image,
    Color,
    Paint,
    Clip,
    Area,
    PointerHandler,
    KeyHandler,
    HideInput,
    Push,
    Pop,
    Aux,
};

inline constexpr uint8_t FirstOpTag = static_cast<uint8_t>(OpType::MacroDef);
inline constexpr uint8_t LastOpTag = static_cast<uint8_t>(OpType::Aux);

//=============================================================================
// Encoded sizes. Multi-byte fields are little-endian.
//=============================================================================
inline constexpr size_t MacroDefSize = 1 + 4 + 4;
inline constexpr size_t MacroSize = 1 + 4 + 4 + 4;
inline constexpr size_t TransformSize = 1 + 4 * 2;
inline constexpr size_t LayerSize = 1;
inline constexpr size_t InvalidateSize = 1 + 8;
inline constexpr size_t ImageSize = 1 + 4 * 4;
inline constexpr size_t ColorSize = 1 + 4;
inline constexpr size_t PaintSize = 1 + 4 * 4;
inline constexpr size_t ClipSize = 1 + 4 * 4;
inline constexpr size_t AreaSize = 1 + 1 + 4 * 4;
inline constexpr size_t PointerHandlerSize = 1 + 1;
inline constexpr size_t KeyHandlerSize = 1 + 1;
inline constexpr size_t HideInputSize = 1;
inline constexpr size_t PushSize = 1;
inline constexpr size_t PopSize = 1;
// Header only; the payload length follows in the u32 field.
inline constexpr size_t AuxSize = 1 + 4;

struct OpProps {
    size_t size;
    uint32_t numRefs;
};

inline constexpr std::array<OpProps, LastOpTag - FirstOpTag + 1> OpPropsTable = {{
    {MacroDefSize, 0},
    {MacroSize, 1},
    {TransformSize, 0},
    {LayerSize, 0},
    {InvalidateSize, 0},
    {ImageSize, 2},
    {ColorSize, 0},
    {PaintSize, 0},
    {ClipSize, 0},
    {AreaSize, 0},
    {PointerHandlerSize, 1},
    {KeyHandlerSize, 1},
    {HideInputSize, 0},
    {PushSize, 0},
    {PopSize, 0},
    {AuxSize, 0},
}};

constexpr bool isOpTag(uint8_t tag) noexcept {
    return tag >= FirstOpTag && tag <= LastOpTag;
}

constexpr OpProps opProps(OpType t) noexcept {
    return OpPropsTable[static_cast<uint8_t>(t) - FirstOpTag];
}

// Props for a raw tag byte, nullopt for bytes outside the closed set
constexpr std::optional<OpProps> opProps(uint8_t tag) noexcept {
    if (!isOpTag(tag)) return std::nullopt;
    return OpPropsTable[tag - FirstOpTag];
}

const char* opTypeName(OpType t) noexcept;

} // namespace weft
