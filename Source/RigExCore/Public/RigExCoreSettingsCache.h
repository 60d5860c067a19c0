// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "RigExSettingsCacheBody.h"

#define RIGEX_CORE_SETTINGS RIGEX_SETTINGS_INST(Core)

struct RIGEXCORE_API FRigExCoreSettingsCache
{
	RIGEX_SETTING_CACHE_BODY(Core)

	/** Below this length a direction is considered degenerate. */
	double DegenerateLength = 1e-4;

	/** Verbosity applied to every FRigExLog category at startup (0 = Off .. 4 = Verbose). */
	int32 DefaultLogVerbosity = 2;

	bool bAccumulateBuildLog = true;

	bool IsDegenerate(const double InLength) const { return InLength < DegenerateLength; }
};
