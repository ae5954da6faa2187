#include "dynconn/dynamic_connection.hpp"

#include <godot_cpp/classes/project_settings.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

using namespace godot;

DynamicConnection::DynamicConnection() : link(&backend) {
}

void DynamicConnection::trace(const String &what) const {
    ProjectSettings *ps = ProjectSettings::get_singleton();
    if (!ps) return;
    if (!(bool)ps->get_setting(SETTING_VERBOSE, false)) return;
    UtilityFunctions::print(String("[DynamicConnection] ") + what + " -> " + _to_string());
}

Error DynamicConnection::report_failure(LinkError err, const String &method) const {
    UtilityFunctions::push_error(String("[DynamicConnection] ") + method + ": " + String(link_error_to_string(err)));
    return ERR_INVALID_PARAMETER;
}

Ref<DynamicConnection> DynamicConnection::create_empty(int64_t flags) {
    Ref<DynamicConnection> dc;
    dc.instantiate();
    dc->set_flags(flags);
    return dc;
}

Ref<DynamicConnection> DynamicConnection::create(const Signal &signal, const Callable &callable, int64_t flags) {
    Ref<DynamicConnection> dc;
    dc.instantiate();
    // set_signal_and_callable already pushed the error
    if (dc->set_signal_and_callable(signal, callable, flags) != OK) return Ref<DynamicConnection>();
    return dc;
}

void DynamicConnection::set_signal_and_callable_or_null(const Signal &signal, const Callable &callable, int64_t flags) {
    link.set_link_or_null(signal, callable, flags);
    trace("set_signal_and_callable_or_null");
}

Error DynamicConnection::set_signal_and_callable(const Signal &signal, const Callable &callable, int64_t flags) {
    LinkError err = link.set_link(signal, callable, flags);
    if (err != LINK_OK) return report_failure(err, "set_signal_and_callable");
    trace("set_signal_and_callable");
    return OK;
}

void DynamicConnection::remove_signal_and_callable() {
    link.remove_link();
    trace("remove_signal_and_callable");
}

void DynamicConnection::set_signal_or_null(const Signal &signal) {
    link.set_source_or_null(signal);
    trace("set_signal_or_null");
}

Error DynamicConnection::set_signal(const Signal &signal) {
    LinkError err = link.set_source(signal);
    if (err != LINK_OK) return report_failure(err, "set_signal");
    trace("set_signal");
    return OK;
}

void DynamicConnection::set_callable_or_null(const Callable &callable) {
    link.set_target_or_null(callable);
    trace("set_callable_or_null");
}

Error DynamicConnection::set_callable(const Callable &callable) {
    LinkError err = link.set_target(callable);
    if (err != LINK_OK) return report_failure(err, "set_callable");
    trace("set_callable");
    return OK;
}

Signal DynamicConnection::get_signal() const {
    return link.get_source();
}

Callable DynamicConnection::get_callable() const {
    return link.get_target();
}

void DynamicConnection::set_flags(int64_t flags) {
    LinkError err = link.set_flags(flags);
    if (err != LINK_OK) {
        UtilityFunctions::push_error(String("[DynamicConnection] set_flags: ") + String(link_error_to_string(err)));
        return;
    }
    trace("set_flags");
}

int64_t DynamicConnection::get_flags() const {
    return link.get_flags();
}

bool DynamicConnection::is_valid() const {
    return link.is_valid();
}

bool DynamicConnection::is_connection_active() const {
    return link.is_link_active();
}

String DynamicConnection::_to_string() const {
    String sig = link.get_source().is_null() ? String("<null>") : String(link.get_source().get_name());
    String call = link.get_target().is_null() ? String("<null>") : Variant(link.get_target()).operator String();
    return String("DynamicConnection(") + sig + " -> " + call + ", " + (is_connection_active() ? "active" : "inactive") + ")";
}

void DynamicConnection::_bind_methods() {
    ClassDB::bind_static_method("DynamicConnection", D_METHOD("create_empty", "flags"), &DynamicConnection::create_empty, DEFVAL(0));
    ClassDB::bind_static_method("DynamicConnection", D_METHOD("create", "signal", "callable", "flags"), &DynamicConnection::create, DEFVAL(0));

    ClassDB::bind_method(D_METHOD("set_signal_and_callable_or_null", "signal", "callable", "flags"), &DynamicConnection::set_signal_and_callable_or_null, DEFVAL(LINK_KEEP_FLAGS));
    ClassDB::bind_method(D_METHOD("set_signal_and_callable", "signal", "callable", "flags"), &DynamicConnection::set_signal_and_callable, DEFVAL(LINK_KEEP_FLAGS));
    ClassDB::bind_method(D_METHOD("remove_signal_and_callable"), &DynamicConnection::remove_signal_and_callable);

    ClassDB::bind_method(D_METHOD("set_signal_or_null", "signal"), &DynamicConnection::set_signal_or_null);
    ClassDB::bind_method(D_METHOD("set_signal", "signal"), &DynamicConnection::set_signal);
    ClassDB::bind_method(D_METHOD("set_callable_or_null", "callable"), &DynamicConnection::set_callable_or_null);
    ClassDB::bind_method(D_METHOD("set_callable", "callable"), &DynamicConnection::set_callable);
    ClassDB::bind_method(D_METHOD("get_signal"), &DynamicConnection::get_signal);
    ClassDB::bind_method(D_METHOD("get_callable"), &DynamicConnection::get_callable);

    ClassDB::bind_method(D_METHOD("set_flags", "flags"), &DynamicConnection::set_flags);
    ClassDB::bind_method(D_METHOD("get_flags"), &DynamicConnection::get_flags);

    ClassDB::bind_method(D_METHOD("is_valid"), &DynamicConnection::is_valid);
    ClassDB::bind_method(D_METHOD("is_connection_active"), &DynamicConnection::is_connection_active);

    // signal/callable are runtime-only; only the flags are exposed to the inspector
    ADD_PROPERTY(PropertyInfo(Variant::INT, "flags", PROPERTY_HINT_FLAGS, "Deferred,Persist,One Shot,Reference Counted"), "set_flags", "get_flags");
}
