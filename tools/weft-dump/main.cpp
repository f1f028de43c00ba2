#include <weft/config.h>
#include <weft/decoded-op.h>
#include <weft/layout/stack.h>
#include <weft/ops/recorder.h>
#include <weft/paint/path-builder.h>
#include <weft/surface.h>

#include <args.hxx>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

#include <iostream>
#include <string>

using namespace weft;

//-----------------------------------------------------------------------------
// Demo frames
//-----------------------------------------------------------------------------

static constexpr paint::Color Red{0xff, 0x00, 0x00, 0xff};
static constexpr paint::Color Blue{0x00, 0x00, 0xff, 0xff};

static Result<void> rect(Ops& ops, paint::Color color, f32::Rect r) {
    StackOp stack;
    WEFT_CHECK(stack.push(ops), "push");
    WEFT_CHECK(paint::ColorOp{color}.add(ops), "color");
    WEFT_CHECK(paint::PaintOp{r}.add(ops), "paint");
    return stack.pop();
}

// One recorded square replayed at two offsets
static Result<void> macroScene(Ops& ops, const layout::Constraints&) {
    MacroRecorder rec;
    WEFT_CHECK(rec.record(ops), "record");
    WEFT_CHECK(rect(ops, Red, {{0, 0}, {50, 50}}), "square");
    auto square = rec.stop();
    if (!square) return Err<void>("stop", square);

    for (float x : {10.0f, 100.0f}) {
        StackOp stack;
        WEFT_CHECK(stack.push(ops), "push");
        WEFT_CHECK(TransformOp{Transform::offset({x, 20})}.add(ops), "offset");
        WEFT_CHECK(square->add(ops), "invoke");
        WEFT_CHECK(stack.pop(), "pop");
    }
    return Ok();
}

// A big and a small child, centered on each other
static Result<void> stackScene(Ops& ops, const layout::Constraints& cs) {
    layout::Stack stack;
    stack.alignment = layout::Direction::Center;
    stack.init(ops, cs.loose());

    if (auto c = stack.rigid(); !c) return Err<void>("rigid", c);
    WEFT_CHECK(rect(ops, Blue, {{0, 0}, {200, 100}}), "big");
    auto big = stack.end({{200, 100}, 100});
    if (!big) return Err<void>("end", big);

    if (auto c = stack.rigid(); !c) return Err<void>("rigid", c);
    WEFT_CHECK(rect(ops, Red, {{0, 0}, {40, 40}}), "small");
    auto small = stack.end({{40, 40}, 40});
    if (!small) return Err<void>("end", small);

    auto dims = stack.layout({*big, *small});
    if (!dims) return Err<void>("layout", dims);
    yinfo("stack: {}x{} baseline {}", dims->size.x, dims->size.y, dims->baseline);
    return Ok();
}

// A triangle clip path filled red
static Result<void> pathScene(Ops& ops, const layout::Constraints&) {
    StackOp stack;
    WEFT_CHECK(stack.push(ops), "push");
    paint::PathBuilder path(ops);
    WEFT_CHECK(path.move({20, 20}), "move");
    WEFT_CHECK(path.line({100, 0}), "line");
    WEFT_CHECK(path.quad({-50, 80}, {-100, 0}), "quad");
    WEFT_CHECK(path.end(), "end");
    WEFT_CHECK(paint::ColorOp{Red}.add(ops), "color");
    WEFT_CHECK(paint::PaintOp{{{0, 0}, {200, 200}}}.add(ops), "paint");
    return stack.pop();
}

// A button-like area with pointer and key handlers
static input::Tag::Ptr buttonTag;

static Result<void> inputScene(Ops& ops, const layout::Constraints&) {
    StackOp stack;
    WEFT_CHECK(stack.push(ops), "push");
    WEFT_CHECK(input::AreaOp::makeRect({{10, 10}, {110, 50}}).add(ops), "area");
    WEFT_CHECK((input::PointerHandlerOp{buttonTag, true}).add(ops), "pointer handler");
    WEFT_CHECK((input::KeyHandlerOp{buttonTag, true}).add(ops), "key handler");
    WEFT_CHECK(InvalidateOp{}.add(ops), "invalidate");
    WEFT_CHECK(stack.pop(), "pop");
    return rect(ops, Blue, {{10, 10}, {110, 50}});
}

//-----------------------------------------------------------------------------
// Output
//-----------------------------------------------------------------------------

static Result<void> dumpOps(const Ops::ConstPtr& ops) {
    Reader reader;
    if (auto res = reader.reset(ops); !res) return res;
    for (;;) {
        auto next = reader.decode();
        if (!next) return Err<void>("decode", next);
        if (!*next) break;
        auto op = decodeOp(**next);
        if (!op) return Err<void>("decode", op);
        std::cout << "op  " << (*next)->key.ops << ":" << (*next)->key.pc << "  "
                  << describe(*op) << "\n";
    }
    return Ok();
}

static void dumpDrawList(const paint::DrawList& list) {
    if (list.clearColor) {
        auto c = *list.clearColor;
        std::cout << "clear rgba(" << int(c.r) << "," << int(c.g) << "," << int(c.b) << ","
                  << int(c.a) << ")\n";
    }
    for (const auto& cmd : list.commands) {
        const auto& m = cmd.material;
        std::cout << "draw (" << cmd.clip.min.x << "," << cmd.clip.min.y << ")-("
                  << cmd.clip.max.x << "," << cmd.clip.max.y << ")";
        if (m.kind == paint::Material::Kind::Color) {
            std::cout << " rgba(" << int(m.color.r) << "," << int(m.color.g) << ","
                      << int(m.color.b) << "," << int(m.color.a) << ")";
        } else {
            std::cout << " image " << m.image->id();
        }
        if (cmd.clipPath >= 0) {
            std::cout << " path " << cmd.clipPath << " ("
                      << list.paths[cmd.clipPath].vertices.size() / paint::PathVertex::Stride
                      << " vertices)";
        }
        std::cout << "\n";
    }
}

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------

int main(int argc, const char** argv) {
    args::ArgumentParser parser("weft-dump", "Record a demo frame and dump its op stream.");
    parser.Prog("weft-dump");

    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "file", "Config file", {'c', "config"});
    args::ValueFlag<int> widthFlag(parser, "px", "Surface width", {'W', "width"});
    args::ValueFlag<int> heightFlag(parser, "px", "Surface height", {'H', "height"});
    args::ValueFlag<std::string> scenarioFlag(parser, "name",
        "Demo frame: stack, macro, path or input (default: macro)", {'s', "scenario"}, "macro");
    args::ValueFlag<std::string> logFlag(parser, "level",
        "Log level: trace, debug, info, warn, error", {'l', "log-level"});
    args::Flag printConfigFlag(parser, "print-config",
        "Print the effective configuration and exit", {"print-config"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    YAML::Node overrides;
    if (widthFlag) overrides["surface"]["width"] = args::get(widthFlag);
    if (heightFlag) overrides["surface"]["height"] = args::get(heightFlag);
    if (logFlag) overrides["log"]["level"] = args::get(logFlag);

    auto config = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!config) {
        std::cerr << "weft-dump: " << error_msg(config) << "\n";
        return 1;
    }

    if (printConfigFlag) {
        const auto& source = (*config)->source();
        std::cout << "# " << (source.empty() ? "defaults" : source.string()) << "\n"
                  << (*config)->dump() << "\n";
        return 0;
    }

    spdlog::set_level(
        spdlog::level::from_str((*config)->get<std::string>(Config::KEY_LOG_LEVEL, "info")));
    spdlog::cfg::load_env_levels();

    Surface::LayoutFn scene;
    std::string name = args::get(scenarioFlag);
    if (name == "macro") {
        scene = macroScene;
    } else if (name == "stack") {
        scene = stackScene;
    } else if (name == "path") {
        scene = pathScene;
    } else if (name == "input") {
        auto tag = input::Tag::create("button");
        if (!tag) {
            yerror("Failed to create tag: {}", error_msg(tag));
            return 1;
        }
        buttonTag = *tag;
        scene = inputScene;
    } else {
        std::cerr << "weft-dump: unknown scenario '" << name << "'\n";
        return 1;
    }

    auto surface = Surface::create(*config);
    if (!surface) {
        yerror("Failed to create surface: {}", error_msg(surface));
        return 1;
    }

    auto frame = (*surface)->frame(scene);
    if (!frame) {
        yerror("Frame failed: {}", error_msg(frame));
        return 1;
    }

    if (auto res = dumpOps((*surface)->ops()); !res) {
        yerror("Dump failed: {}", error_msg(res));
        return 1;
    }
    dumpDrawList(*frame->drawList);
    std::cout << "text-input " << input::textInputStateName(frame->textInput) << "\n";
    if (frame->wakeup) {
        std::cout << "wakeup requested\n";
    }

    if (buttonTag) {
        input::PointerEvent press;
        press.type = input::PointerType::Press;
        press.position = {20, 20};
        (*surface)->addEvent(press);
        for (const auto& ev : (*surface)->events(buttonTag)) {
            if (const auto* p = std::get_if<input::PointerEvent>(&ev)) {
                std::cout << "event pointer type=" << int(p->type) << " at (" << p->position.x
                          << "," << p->position.y << ") hit=" << p->hit << "\n";
            } else if (const auto* f = std::get_if<input::FocusEvent>(&ev)) {
                std::cout << "event focus=" << f->focus << "\n";
            }
        }
    }
    return 0;
}
