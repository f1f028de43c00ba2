#pragma once

#include <weft/geom.h>
#include <weft/ops/reader.h>
#include <weft/paint/paint-ops.h>
#include <optional>
#include <vector>

namespace weft {
namespace paint {

struct Material {
    enum class Kind : uint8_t { Color, Texture };

    Kind kind = Kind::Color;
    Color color;
    Image::Ptr image;
    base::Object::Ptr handle;
    IRect uvRect;

    bool opaque() const { return kind == Kind::Color && color.opaque(); }
};

// Outline of a non-rectangular clip. Vertices point into the painted buffer
// and stay valid until it is reset.
struct ClipPath {
    int parent = -1;
    OpKey key;
    f32::Point offset;
    f32::Rect bounds;
    std::span<const uint8_t> vertices;
};

struct DrawCommand {
    // Painted rectangle in viewport coordinates
    f32::Rect rect;
    // rect intersected with the clip in effect
    f32::Rect clip;
    Material material;
    // Index into DrawList::paths, -1 for a rectangular clip
    int clipPath = -1;
};

struct DrawList {
    std::optional<Color> clearColor;
    std::vector<DrawCommand> commands;
    std::vector<ClipPath> paths;

    void clear() {
        clearColor.reset();
        commands.clear();
        paths.clear();
    }
};

//=============================================================================
// Painter - turns the paint ops of a frame into a draw list
//
// Push saves transform, clip and material; Pop restores them. The scope depth
// must be back at zero when the stream ends.
//=============================================================================
class Painter {
public:
    explicit Painter(IPoint viewport = {}) : _viewport(viewport) {}

    void setViewport(IPoint viewport) { _viewport = viewport; }
    IPoint viewport() const { return _viewport; }

    Result<void> collect(const Ops::ConstPtr& ops);

    const DrawList& drawList() const { return _list; }

private:
    struct State {
        Transform transform;
        f32::Rect clip;
        bool rectClip = true;
        int path = -1;
        Material material;
    };

    Result<void> paint(const State& state, const PaintOp& op);

    IPoint _viewport;
    Reader _reader;
    DrawList _list;
};

} // namespace paint
} // namespace weft
