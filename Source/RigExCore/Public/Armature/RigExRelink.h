// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

class FRigExArmature;
class FRigExBuildReport;

namespace RigExRelink
{
	constexpr TCHAR SpecSeparator = TEXT('@');

	/** "Label@CTRL,DEF" split into its label and per-target specs */
	struct RIGEXCORE_API FSpec
	{
		FName Label = NAME_None;
		TArray<FString> Targets;
		bool bMarked = false;

		static FSpec Parse(const FName InConstraintName);

		/** Spec for a target index; a single spec applies to every target */
		const FString& GetTargetSpec(const int32 InIndex) const;
	};
}

/**
 * Rewrites constraint targets on a bone according to the relink specs carried
 * in constraint names.
 *   ""              keep the current target
 *   CTRL            target with its role prefix removed
 *   MCH / DEF / ORG target renamed to that role
 *   anything else   literal bone name
 */
class RIGEXCORE_API FRigExConstraintRelinker
{
public:
	using FTargetOverride = TFunction<FName(const FString& /*Spec*/, const FName /*OldTarget*/)>;

	/** Also relink constraints without a marker, as if every spec was empty */
	bool bRelinkUnmarked = false;

	/** Consulted first; returning NAME_None falls back to the default rules */
	FTargetOverride TargetOverride;

	FRigExConstraintRelinker() = default;

	FName FindTarget(const FString& InSpec, const FName InOldTarget) const;

	/**
	 * Relink every marked constraint of InBone.
	 * @return false if a target could not be resolved; errors go to OutReport
	 */
	bool RelinkBone(FRigExArmature& InArmature, const FName InBone, const FName InRigKind, FRigExBuildReport& OutReport) const;
};
