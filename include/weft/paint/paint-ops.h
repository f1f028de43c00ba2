#pragma once

#include <weft/base/factory.h>
#include <weft/base/object.h>
#include <weft/geom.h>
#include <weft/ops/reader.h>
#include <vector>

namespace weft {
namespace paint {

// Non-premultiplied sRGB color
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;

    bool opaque() const { return a == 0xff; }
    bool operator==(const Color&) const = default;
};

//=============================================================================
// Image - RGBA8 pixels referenced by ImageOp
//=============================================================================
class Image : public base::Object, public base::ObjectFactory<Image> {
public:
    using Ptr = std::shared_ptr<Image>;

    static Result<Ptr> createImpl(int32_t width, int32_t height, std::vector<uint8_t> pixels);

    const char* typeName() const override { return "Image"; }

    IRect bounds() const { return {{0, 0}, {_width, _height}}; }
    const std::vector<uint8_t>& pixels() const { return _pixels; }

    // Single color image, drawn as a color material.
    bool uniform() const;

private:
    Image(int32_t w, int32_t h, std::vector<uint8_t> pixels)
        : _width(w), _height(h), _pixels(std::move(pixels)) {}

    int32_t _width;
    int32_t _height;
    std::vector<uint8_t> _pixels;
};

//=============================================================================
// Material ops
//=============================================================================

struct ColorOp {
    Color color;

    Result<void> add(Ops& ops) const;
    static Result<ColorOp> decode(const EncodedOp& op);
};

// Image material. The handle is the cache identity of the uploaded texture;
// by default the image itself.
struct ImageOp {
    Image::Ptr image;
    base::Object::Ptr handle;
    IRect rect;

    static ImageOp fromImage(Image::Ptr image);

    Result<void> add(Ops& ops) const;
    static Result<ImageOp> decode(const EncodedOp& op);
};

// Fills rect with the current material, clipped by the current clip.
struct PaintOp {
    f32::Rect rect;

    Result<void> add(Ops& ops) const;
    static Result<PaintOp> decode(const EncodedOp& op);
};

// Intersects the current clip with bounds. When written right after an aux
// chunk, the chunk holds the outline of the clip path.
struct ClipOp {
    f32::Rect bounds;

    Result<void> add(Ops& ops) const;
    static Result<ClipOp> decode(const EncodedOp& op);
};

} // namespace paint
} // namespace weft
