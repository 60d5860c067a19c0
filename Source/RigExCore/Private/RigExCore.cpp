// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "RigExCore.h"

#include "Misc/ConfigCacheIni.h"
#include "RigExCoreSettingsCache.h"
#include "Core/RigExLog.h"

RIGEX_IMPLEMENT_MODULE(FRigExCoreModule, RigExCore)

void FRigExCoreModule::UpdateSettingsCache()
{
	RIGEX_CORE_SETTINGS.ResetToDefaults();

	if (GConfig)
	{
		const FString Section = GetSettingsSection();

		RIGEX_PULL_SETTING(Core, Section, Double, DegenerateLength)
		RIGEX_PULL_SETTING(Core, Section, Int, DefaultLogVerbosity)
		RIGEX_PULL_SETTING(Core, Section, Bool, bAccumulateBuildLog)
	}

	RIGEX_CORE_SETTINGS.Sanitize();
	FRigExLog::SetAllVerbosity(static_cast<ERigExLogVerbosity>(RIGEX_CORE_SETTINGS.DefaultLogVerbosity));
}
