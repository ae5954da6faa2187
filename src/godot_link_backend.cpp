#include "dynconn/godot_link_backend.hpp"

#include <godot_cpp/classes/object.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

using namespace godot;

static_assert((int64_t)LINK_DEFERRED == (int64_t)Object::CONNECT_DEFERRED, "LinkFlags must match Object::ConnectFlags");
static_assert((int64_t)LINK_PERSIST == (int64_t)Object::CONNECT_PERSIST, "LinkFlags must match Object::ConnectFlags");
static_assert((int64_t)LINK_ONE_SHOT == (int64_t)Object::CONNECT_ONE_SHOT, "LinkFlags must match Object::ConnectFlags");
static_assert((int64_t)LINK_REFERENCE_COUNTED == (int64_t)Object::CONNECT_REFERENCE_COUNTED, "LinkFlags must match Object::ConnectFlags");

bool GodotLinkBackend::has_live_owner(const Signal &source) const {
    if (source.is_null()) return false;
    // get_object() resolves through the ObjectDB and yields null once freed
    Object *owner = source.get_object();
    if (!owner) return false;
    return owner->has_signal(source.get_name());
}

bool GodotLinkBackend::is_invokable(const Callable &target) const {
    return target.is_valid();
}

bool GodotLinkBackend::is_connected(const Signal &source, const Callable &target) const {
    return source.is_connected(target);
}

void GodotLinkBackend::connect(const Signal &source, const Callable &target, uint32_t flags) {
    // Signal::connect/disconnect are non-const in godot-cpp
    Signal sig = source;
    int64_t err = sig.connect(target, flags);
    if (err != OK) {
        UtilityFunctions::push_error(String("[DynamicConnection] connecting signal '") + String(source.get_name()) + "' failed with error " + String::num_int64(err));
    }
}

void GodotLinkBackend::disconnect(const Signal &source, const Callable &target) {
    Signal sig = source;
    sig.disconnect(target);
}
