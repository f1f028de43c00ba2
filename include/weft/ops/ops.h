#pragma once

#include <weft/base/factory.h>
#include <weft/base/object.h>
#include <weft/ops/op-type.h>
#include <weft/result.hpp>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <span>
#include <variant>
#include <vector>

namespace weft {

class Ops;

// Out-of-band reference stored beside the byte stream. Objects (images,
// handler tags) are held strongly; a macro invocation holds its source
// buffer weakly so a buffer may invoke its own macros without a cycle.
using Ref = std::variant<base::Object::Ptr, std::weak_ptr<const Ops>>;

// Position in a buffer: byte offset into data, index into refs.
struct Pc {
    uint32_t data = 0;
    uint32_t refs = 0;

    bool operator==(const Pc&) const = default;
};

using MacroId = uint32_t;

//=============================================================================
// MacroOp - handle to a recorded range of a buffer
//
// Adding the handle to a buffer writes a single invocation record. It never
// copies the recorded bytes. The handle is only valid while its source buffer
// is alive and still at the version it was recorded at.
//=============================================================================
class MacroOp {
public:
    MacroOp() = default;
    MacroOp(std::weak_ptr<const Ops> ops, Pc pc, uint32_t version)
        : _ops(std::move(ops)), _pc(pc), _version(version), _valid(true) {}

    // Writes an invocation into target. An empty handle adds nothing.
    Result<void> add(Ops& target) const;

    bool empty() const { return !_valid; }
    Pc pc() const { return _pc; }
    uint32_t version() const { return _version; }
    std::shared_ptr<const Ops> ops() const { return _ops.lock(); }

private:
    std::weak_ptr<const Ops> _ops;
    Pc _pc;
    uint32_t _version = 0;
    bool _valid = false;
};

//=============================================================================
// Ops - append-only operation buffer
//
// Layout:
//   data: tagged records back to back, tag byte first
//   refs: references consumed positionally by records in data order
//
// Consecutive Aux writes are merged into one chunk: [Aux][len u32][payload].
// A recording reserves a MacroDef header at record() and patches it with the
// end pc at stop(). reset() truncates both arrays and bumps the version, which
// invalidates every MacroOp taken before it.
//=============================================================================
class Ops : public base::Object, public base::ObjectFactory<Ops> {
public:
    using Ptr = std::shared_ptr<Ops>;
    using ConstPtr = std::shared_ptr<const Ops>;

    static Result<Ptr> createImpl();
    static Result<Ptr> createImpl(size_t reserveBytes, size_t reserveRefs);

    ~Ops() override = default;

    const char* typeName() const override { return "Ops"; }

    // Append one encoded op with exactly the number of refs its kind takes.
    // For Aux, op[1:] is appended to the open chunk (or opens a new one).
    Result<void> write(std::span<const uint8_t> op, std::initializer_list<Ref> refs = {});

    // Mutable payload of the open aux chunk, empty when none is open.
    std::span<uint8_t> aux();

    Result<MacroId> record();
    Result<MacroOp> stop(MacroId id);

    void reset();

    std::span<const uint8_t> data() const { return _data; }
    std::span<const Ref> refs() const { return _refs; }
    uint32_t version() const { return _version; }
    Pc pc() const;

    // Number of recordings started and not yet stopped
    size_t openRecordings() const { return _macroStack.size(); }
    uint32_t scopeDepth() const { return _scopeDepth; }

private:
    friend class StackOp;

    struct Recording {
        MacroId id;
        Pc start;
        // scopes open when the recording started; stop() requires the same
        uint32_t scopeDepth;
    };

    Ops() = default;

    Result<void> validateRefs(OpType type, std::initializer_list<Ref> refs) const;
    void append(std::span<const uint8_t> op, std::initializer_list<Ref> refs);
    void closeAux();

    std::vector<uint8_t> _data;
    std::vector<Ref> _refs;
    std::vector<Recording> _macroStack;
    MacroId _nextMacroId = 1;
    uint32_t _version = 0;
    uint32_t _scopeDepth = 0;

    bool _inAux = false;
    size_t _auxOff = 0;
    uint32_t _auxLen = 0;
};

} // namespace weft
