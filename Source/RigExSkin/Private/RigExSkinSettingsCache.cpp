// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "RigExSkinSettingsCache.h"

#include "HAL/IConsoleManager.h"

namespace RigExSkinConsoleVars
{
	static TAutoConsoleVariable<float> CVarMergeTolerance{
		TEXT("rigex.MergeTolerance"),
		-1.f,
		TEXT("Overrides the control node merge tolerance. Any negative value is discarded.")
	};

	static TAutoConsoleVariable<int32> CVarDefaultBBoneSegments{
		TEXT("rigex.DefaultBBoneSegments"),
		-1,
		TEXT("Overrides the default number of B-Bone segments of skin chains. Any value below 1 is discarded.")
	};
}

void FRigExSkinSettingsCache::Sanitize()
{
	MergeTolerance = FMath::Max(MergeTolerance, static_cast<double>(SMALL_NUMBER));
	DefaultBBoneSegments = FMath::Max(DefaultBBoneSegments, 1);
	DefaultSharpenThreshold = FMath::Clamp(DefaultSharpenThreshold, 0.0, 180.0);
	if (HandleLengthFactor <= 0) { HandleLengthFactor = FRigExSkinSettingsCache().HandleLengthFactor; }
}

double FRigExSkinSettingsCache::GetMergeTolerance() const
{
	const float Override = RigExSkinConsoleVars::CVarMergeTolerance.GetValueOnAnyThread();
	return FMath::Max(Override >= 0 ? static_cast<double>(Override) : MergeTolerance, SMALL_NUMBER);
}

int32 FRigExSkinSettingsCache::GetDefaultBBoneSegments() const
{
	const int32 Override = RigExSkinConsoleVars::CVarDefaultBBoneSegments.GetValueOnAnyThread();
	return FMath::Max(Override >= 1 ? Override : DefaultBBoneSegments, 1);
}
