// DynamicConnection: RefCounted wrapper around a single swappable Signal -> Callable
// connection. Guarantees at most one live connection and disconnects the old one
// before wiring a new one.
#ifndef DYNCONN_DYNAMIC_CONNECTION_HPP
#define DYNCONN_DYNAMIC_CONNECTION_HPP

#include <godot_cpp/classes/ref_counted.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/callable.hpp>
#include <godot_cpp/variant/signal.hpp>
#include "dynconn/dynamic_link.hpp"
#include "dynconn/godot_link_backend.hpp"

using namespace godot;

class DynamicConnection : public RefCounted {
    GDCLASS(DynamicConnection, RefCounted)

protected:
    static void _bind_methods();

private:
    // Declared before `link` so it is still alive when the link tears itself down.
    GodotLinkBackend backend;
    DynamicLink<Signal, Callable> link;

    void trace(const String &what) const;
    Error report_failure(LinkError err, const String &method) const;

public:
    // ProjectSettings key: print a trace line for every rewire
    static constexpr const char *SETTING_VERBOSE = "dynamic_connection/logging/verbose";

    DynamicConnection();

    // Empty connection with preset flags.
    static Ref<DynamicConnection> create_empty(int64_t flags = 0);
    // Connection wired to `signal` -> `callable`. Returns null if either is invalid.
    static Ref<DynamicConnection> create(const Signal &signal, const Callable &callable, int64_t flags = 0);

    // Negative `flags` (LINK_KEEP_FLAGS) keeps the current flags.
    void set_signal_and_callable_or_null(const Signal &signal, const Callable &callable, int64_t flags = LINK_KEEP_FLAGS);
    Error set_signal_and_callable(const Signal &signal, const Callable &callable, int64_t flags = LINK_KEEP_FLAGS);
    void remove_signal_and_callable();

    void set_signal_or_null(const Signal &signal);
    Error set_signal(const Signal &signal);
    void set_callable_or_null(const Callable &callable);
    Error set_callable(const Callable &callable);

    Signal get_signal() const;
    Callable get_callable() const;

    void set_flags(int64_t flags);
    int64_t get_flags() const;

    bool is_valid() const;
    bool is_connection_active() const;

    String _to_string() const;
};

#endif // DYNCONN_DYNAMIC_CONNECTION_HPP
