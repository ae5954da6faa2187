// GodotLinkBackend: LinkBackend over godot::Signal / godot::Callable
#pragma once

#include <godot_cpp/variant/callable.hpp>
#include <godot_cpp/variant/signal.hpp>
#include "dynconn/link_backend.hpp"

using namespace godot;

class GodotLinkBackend : public LinkBackend<Signal, Callable> {
public:
    bool has_live_owner(const Signal &source) const override;
    bool is_invokable(const Callable &target) const override;

    bool is_connected(const Signal &source, const Callable &target) const override;
    void connect(const Signal &source, const Callable &target, uint32_t flags) override;
    void disconnect(const Signal &source, const Callable &target) override;
};
