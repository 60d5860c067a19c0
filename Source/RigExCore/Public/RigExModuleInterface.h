// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Modules/ModuleManager.h"

#define RIGEX_IMPLEMENT_MODULE(_CLASS, _NAME) \
IMPLEMENT_MODULE(_CLASS, _NAME) \
FString _CLASS::GetModuleName() const{ return TEXT(#_NAME); }

#define RIGEX_MODULE_BODY\
	public:\
	virtual FString GetModuleName() const override;

/**
 * Base of the RigEx modules. Each module owns a settings cache filled from
 * [/Script/<Module>.<Module>Settings] in the engine ini on startup.
 */
class RIGEXCORE_API IRigExModuleInterface : public IModuleInterface
{
public:
	virtual FString GetModuleName() const = 0;

	virtual void StartupModule() override;
	virtual void ShutdownModule() override;

	/** Config section the module settings are read from */
	FString GetSettingsSection() const;

	/** Pull module settings from config into the module's settings cache. */
	virtual void UpdateSettingsCache() = 0;

	static const TArray<IRigExModuleInterface*>& GetRegisteredModules() { return RegisteredModules; }
	static IRigExModuleInterface* FindModule(const FString& InModuleName);

	/** Resets and pulls the settings of every started module, e.g. after editing the ini */
	static void ReloadAllSettings();

private:
	static TArray<IRigExModuleInterface*> RegisteredModules;
};
