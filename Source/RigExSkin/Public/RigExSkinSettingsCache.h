// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "RigExSettingsCacheBody.h"

#define RIGEX_SKIN_SETTINGS RIGEX_SETTINGS_INST(Skin)

struct RIGEXSKIN_API FRigExSkinSettingsCache
{
	RIGEX_SETTING_CACHE_BODY(Skin)

	/** Control points closer than this are merged into one node */
	double MergeTolerance = 1e-4;

	int32 DefaultBBoneSegments = 10;

	/** Corner sharpening threshold in degrees used when a chain doesn't set one; 0 disables */
	double DefaultSharpenThreshold = 0;

	/** Handle length relative to the chain's average bone length */
	double HandleLengthFactor = 0.75;

	double GetMergeTolerance() const;
	int32 GetDefaultBBoneSegments() const;
};
