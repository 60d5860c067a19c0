// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "RigExCoreSettingsCache.h"

#include "Core/RigExLog.h"

void FRigExCoreSettingsCache::Sanitize()
{
	DegenerateLength = FMath::Max(DegenerateLength, static_cast<double>(SMALL_NUMBER));
	DefaultLogVerbosity = FMath::Clamp(DefaultLogVerbosity, 0, static_cast<int32>(ERigExLogVerbosity::Verbose));
}
