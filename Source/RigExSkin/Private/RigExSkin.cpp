// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "RigExSkin.h"

#include "Misc/ConfigCacheIni.h"
#include "RigExSkinSettingsCache.h"

RIGEX_IMPLEMENT_MODULE(FRigExSkinModule, RigExSkin)

void FRigExSkinModule::UpdateSettingsCache()
{
	RIGEX_SKIN_SETTINGS.ResetToDefaults();

	if (GConfig)
	{
		const FString Section = GetSettingsSection();

		RIGEX_PULL_SETTING(Skin, Section, Double, MergeTolerance)
		RIGEX_PULL_SETTING(Skin, Section, Int, DefaultBBoneSegments)
		RIGEX_PULL_SETTING(Skin, Section, Double, DefaultSharpenThreshold)
		RIGEX_PULL_SETTING(Skin, Section, Double, HandleLengthFactor)
	}

	RIGEX_SKIN_SETTINGS.Sanitize();
}
