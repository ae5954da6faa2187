// Include your classes, that you want to expose to Godot
#include "dynconn/dynamic_connection.hpp"

#include <gdextension_interface.h>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/core/defs.hpp>
#include <godot_cpp/godot.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <godot_cpp/classes/project_settings.hpp>

using namespace godot;

static void register_project_settings() {
	ProjectSettings *ps = ProjectSettings::get_singleton();
	if (!ps) {
		return;
	}
	if (!ps->has_setting(DynamicConnection::SETTING_VERBOSE)) {
		ps->set_setting(DynamicConnection::SETTING_VERBOSE, false);
	}
	ps->set_initial_value(DynamicConnection::SETTING_VERBOSE, false);

	Dictionary info;
	info["name"] = DynamicConnection::SETTING_VERBOSE;
	info["type"] = Variant::BOOL;
	ps->add_property_info(info);

	if ((bool)ps->get_setting(DynamicConnection::SETTING_VERBOSE, false)) {
		UtilityFunctions::print("[dynconn] registered DynamicConnection");
	}
}

void initialize_gdextension_types(ModuleInitializationLevel p_level)
{
	if (p_level != MODULE_INITIALIZATION_LEVEL_SCENE) {
		return;
	}

	GDREGISTER_CLASS(DynamicConnection)

	register_project_settings();
}

void uninitialize_gdextension_types(ModuleInitializationLevel p_level) {
	if (p_level != MODULE_INITIALIZATION_LEVEL_SCENE) {
		return;
	}
}

extern "C"
{
	// Initialization
	GDExtensionBool GDE_EXPORT dynconn_init(GDExtensionInterfaceGetProcAddress p_get_proc_address, GDExtensionClassLibraryPtr p_library, GDExtensionInitialization *r_initialization)
	{
		GDExtensionBinding::InitObject init_obj(p_get_proc_address, p_library, r_initialization);
		init_obj.register_initializer(initialize_gdextension_types);
		init_obj.register_terminator(uninitialize_gdextension_types);
		init_obj.set_minimum_library_initialization_level(MODULE_INITIALIZATION_LEVEL_SCENE);

		return init_obj.init();
	}
}
