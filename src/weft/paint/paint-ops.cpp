#include <weft/paint/paint-ops.h>
#include <weft/ops/byte-order.h>
#include <weft/ui-ops.h>

namespace weft {
namespace paint {

namespace {

void putRect(uint8_t* p, const f32::Rect& r) {
    bo::putF32(p, r.min.x);
    bo::putF32(p + 4, r.min.y);
    bo::putF32(p + 8, r.max.x);
    bo::putF32(p + 12, r.max.y);
}

f32::Rect getRect(const uint8_t* p) {
    return {{bo::getF32(p), bo::getF32(p + 4)}, {bo::getF32(p + 8), bo::getF32(p + 12)}};
}

} // namespace

//=============================================================================
// Image
//=============================================================================

Result<Image::Ptr> Image::createImpl(int32_t width, int32_t height, std::vector<uint8_t> pixels) {
    if (width < 0 || height < 0) {
        return Err<Ptr>("negative image size");
    }
    if (pixels.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * 4) {
        return Err<Ptr>("image pixel buffer does not match " + std::to_string(width) + "x" +
                        std::to_string(height));
    }
    return Ok(Ptr(new Image(width, height, std::move(pixels))));
}

bool Image::uniform() const {
    if (_pixels.size() < 4) return false;
    for (size_t i = 4; i < _pixels.size(); i += 4) {
        if (!std::equal(_pixels.begin(), _pixels.begin() + 4, _pixels.begin() + i)) {
            return false;
        }
    }
    return true;
}

//=============================================================================
// ColorOp
//=============================================================================

Result<void> ColorOp::add(Ops& ops) const {
    const uint8_t data[ColorSize] = {static_cast<uint8_t>(OpType::Color), color.r, color.g,
                                     color.b, color.a};
    return ops.write(data);
}

Result<ColorOp> ColorOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Color); !res) {
        return Err<ColorOp>("decode", res);
    }
    return Ok(ColorOp{Color{op.data[1], op.data[2], op.data[3], op.data[4]}});
}

//=============================================================================
// ImageOp
//=============================================================================

ImageOp ImageOp::fromImage(Image::Ptr image) {
    ImageOp op;
    if (image) {
        op.rect = image->bounds();
        op.handle = image;
    }
    op.image = std::move(image);
    return op;
}

Result<void> ImageOp::add(Ops& ops) const {
    if (!image) {
        return Err<void>("ImageOp without image");
    }
    uint8_t data[ImageSize];
    data[0] = static_cast<uint8_t>(OpType::Image);
    bo::putI32(data + 1, rect.min.x);
    bo::putI32(data + 5, rect.min.y);
    bo::putI32(data + 9, rect.max.x);
    bo::putI32(data + 13, rect.max.y);
    base::Object::Ptr h = handle ? handle : image;
    return ops.write(data, {Ref(base::Object::Ptr(image)), Ref(h)});
}

Result<ImageOp> ImageOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Image); !res) {
        return Err<ImageOp>("decode", res);
    }
    auto* obj = std::get_if<base::Object::Ptr>(&op.refs[0]);
    auto* handle = std::get_if<base::Object::Ptr>(&op.refs[1]);
    if (!obj || !handle) {
        return Err<ImageOp>("ImageOp refs are not objects");
    }
    auto image = std::dynamic_pointer_cast<Image>(*obj);
    if (!image) {
        return Err<ImageOp>("ImageOp ref is not an image");
    }
    const uint8_t* p = op.data.data();
    ImageOp img;
    img.image = std::move(image);
    img.handle = *handle;
    img.rect = {{bo::getI32(p + 1), bo::getI32(p + 5)}, {bo::getI32(p + 9), bo::getI32(p + 13)}};
    return Ok(std::move(img));
}

//=============================================================================
// PaintOp / ClipOp
//=============================================================================

Result<void> PaintOp::add(Ops& ops) const {
    uint8_t data[PaintSize];
    data[0] = static_cast<uint8_t>(OpType::Paint);
    putRect(data + 1, rect);
    return ops.write(data);
}

Result<PaintOp> PaintOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Paint); !res) {
        return Err<PaintOp>("decode", res);
    }
    return Ok(PaintOp{getRect(op.data.data() + 1)});
}

Result<void> ClipOp::add(Ops& ops) const {
    uint8_t data[ClipSize];
    data[0] = static_cast<uint8_t>(OpType::Clip);
    putRect(data + 1, bounds);
    return ops.write(data);
}

Result<ClipOp> ClipOp::decode(const EncodedOp& op) {
    if (auto res = expectType(op, OpType::Clip); !res) {
        return Err<ClipOp>("decode", res);
    }
    return Ok(ClipOp{getRect(op.data.data() + 1)});
}

} // namespace paint
} // namespace weft
