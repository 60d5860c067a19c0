// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

enum class ERigExBoneRole : uint8
{
	Control = 0,
	Mechanism,
	Deform,
	Original,
};

namespace RigExNaming
{
	/** "MCH", "DEF", "ORG", or empty for controls */
	RIGEXCORE_API const TCHAR* GetRolePrefix(const ERigExBoneRole InRole);

	RIGEXCORE_API FString StripPrefix(const FString& InName);
	FORCEINLINE FName StripPrefix(const FName InName) { return FName(StripPrefix(InName.ToString())); }

	/**
	 * Name of a bone derived from InName for another role, with an optional suffix
	 * inserted before the symmetry tags: lip.T.L + Mechanism + _handle = MCH-lip_handle.T.L
	 */
	RIGEXCORE_API FName MakeDerivedName(const FName InName, const ERigExBoneRole InRole, const FString& InSuffix = FString());

	RIGEXCORE_API FName MakeOrgName(const FName InName);
	RIGEXCORE_API bool IsOrgName(const FName InName);
}
