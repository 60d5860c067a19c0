// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

/**
 * Singleton body of a module settings cache. The cache declares Sanitize(), which clamps
 * values pulled from config back into their valid range.
 */
#define RIGEX_SETTING_CACHE_BODY(_MODULE)\
static FRigEx##_MODULE##SettingsCache& Get()\
{\
	static FRigEx##_MODULE##SettingsCache Instance;\
	return Instance;\
}\
/** Back to compiled defaults, before config is pulled again */\
void ResetToDefaults() { *this = FRigEx##_MODULE##SettingsCache(); }\
void Sanitize();\
private:\
	FRigEx##_MODULE##SettingsCache() = default;\
public:

#define RIGEX_SETTINGS_INST(_MODULE) FRigEx##_MODULE##SettingsCache::Get()

// Reads a single value from the engine ini into a settings cache member, leaving the default if absent.
#define RIGEX_PULL_SETTING(_MODULE, _SECTION, _TYPE, _SETTING) GConfig->Get##_TYPE(*_SECTION, TEXT(#_SETTING), RIGEX_SETTINGS_INST(_MODULE)._SETTING, GEngineIni);
