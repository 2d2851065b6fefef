// Generation tokens: supersede in-flight continuations without cancelling them explicitly
#pragma once
#include <cstdint>

namespace sk::core {

// Per-resource counter. Every command that starts a new continuation on the resource bumps it.
class Generation {
public:
    uint64_t bump() noexcept { return ++value_; }
    uint64_t current() const noexcept { return value_; }

private:
    uint64_t value_{0};
};

// Value captured when a continuation was started. The continuation must check valid()
// at every resumption point and leave all state untouched once it turns false.
struct Epoch {
    const Generation* source = nullptr;
    uint64_t value = 0;

    bool valid() const noexcept { return source != nullptr && source->current() == value; }
};

// Bumps `gen` and returns the epoch owned by the caller.
inline Epoch advance(Generation& gen) noexcept { return Epoch{&gen, gen.bump()}; }

// Captures the current epoch without superseding anything.
inline Epoch capture(const Generation& gen) noexcept { return Epoch{&gen, gen.current()}; }

} // namespace sk::core
