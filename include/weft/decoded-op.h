#pragma once

#include <weft/input/key.h>
#include <weft/input/pointer.h>
#include <weft/paint/paint-ops.h>
#include <weft/ui-ops.h>
#include <string>
#include <variant>

namespace weft {

// Every op kind a reader can emit. Macro definitions and invocations never
// reach consumers, so they have no alternative here.
using DecodedOp = std::variant<TransformOp, LayerOp, InvalidateOp, paint::ImageOp, paint::ColorOp,
                               paint::PaintOp, paint::ClipOp, input::AreaOp,
                               input::PointerHandlerOp, input::KeyHandlerOp, input::HideInputOp,
                               PushOp, PopOp, AuxOp>;

Result<DecodedOp> decodeOp(const EncodedOp& op);

// One line description used by dumps and logs
std::string describe(const DecodedOp& op);

} // namespace weft
