// LinkBackend: the host event system as seen by a DynamicLink.
// Answers liveness / invokability queries and performs the actual wiring.
#pragma once

#include <cstdint>

// Connection behavior bits. Values mirror Godot's Object::ConnectFlags so the
// Godot backend can pass them through unchanged.
enum LinkFlags : uint32_t {
    LINK_DEFERRED = 1,
    LINK_PERSIST = 2,
    LINK_ONE_SHOT = 4,
    LINK_REFERENCE_COUNTED = 8,
};

template <typename SourceT, typename TargetT>
class LinkBackend {
public:
    typedef SourceT source_type;
    typedef TargetT target_type;

    virtual ~LinkBackend() {}

    // True if the object emitting `source` is alive and still provides it.
    // A null source has no owner.
    virtual bool has_live_owner(const SourceT &source) const = 0;
    virtual bool is_invokable(const TargetT &target) const = 0;

    virtual bool is_connected(const SourceT &source, const TargetT &target) const = 0;
    // Implementations report their own wiring failures; callers only hand over
    // pairs that passed has_live_owner() and is_invokable().
    virtual void connect(const SourceT &source, const TargetT &target, uint32_t flags) = 0;
    virtual void disconnect(const SourceT &source, const TargetT &target) = 0;
};
