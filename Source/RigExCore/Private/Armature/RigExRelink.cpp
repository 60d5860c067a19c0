// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Armature/RigExRelink.h"

#include "Armature/RigExArmature.h"
#include "Core/RigExBuildReport.h"
#include "Core/RigExLog.h"
#include "Naming/RigExBoneNaming.h"

namespace RigExRelink
{
	FSpec FSpec::Parse(const FName InConstraintName)
	{
		FSpec Result;
		const FString Name = InConstraintName.ToString();

		int32 Pos = INDEX_NONE;
		if (!Name.FindChar(SpecSeparator, Pos))
		{
			Result.Label = InConstraintName;
			return Result;
		}

		Result.bMarked = true;
		Result.Label = FName(Name.Left(Pos));
		Name.RightChop(Pos + 1).ParseIntoArray(Result.Targets, TEXT(","), false);
		for (FString& Target : Result.Targets) { Target.TrimStartAndEndInline(); }
		if (Result.Targets.IsEmpty()) { Result.Targets.Add(FString()); }

		return Result;
	}

	const FString& FSpec::GetTargetSpec(const int32 InIndex) const
	{
		return Targets.Num() == 1 ? Targets[0] : Targets[InIndex];
	}
}

FName FRigExConstraintRelinker::FindTarget(const FString& InSpec, const FName InOldTarget) const
{
	if (TargetOverride)
	{
		const FName Overridden = TargetOverride(InSpec, InOldTarget);
		if (!Overridden.IsNone()) { return Overridden; }
	}

	if (InSpec.IsEmpty()) { return InOldTarget; }
	if (InSpec == TEXT("CTRL")) { return RigExNaming::StripPrefix(InOldTarget); }
	if (InSpec == TEXT("MCH")) { return RigExNaming::MakeDerivedName(InOldTarget, ERigExBoneRole::Mechanism); }
	if (InSpec == TEXT("DEF")) { return RigExNaming::MakeDerivedName(InOldTarget, ERigExBoneRole::Deform); }
	if (InSpec == TEXT("ORG")) { return RigExNaming::MakeDerivedName(InOldTarget, ERigExBoneRole::Original); }

	return FName(InSpec);
}

bool FRigExConstraintRelinker::RelinkBone(FRigExArmature& InArmature, const FName InBone, const FName InRigKind, FRigExBuildReport& OutReport) const
{
	FRigExBone* Bone = InArmature.Find(InBone);
	if (!Bone) { return false; }

	bool bSuccess = true;

	for (FRigExConstraint& Con : Bone->Constraints)
	{
		const RigExRelink::FSpec Spec = RigExRelink::FSpec::Parse(Con.Name);
		if (!Spec.bMarked && !bRelinkUnmarked) { continue; }

		if (Spec.bMarked && Spec.Targets.Num() != 1 && Spec.Targets.Num() != Con.Targets.Num())
		{
			OutReport.AddError(
				InBone, InRigKind, FString::Printf(
					TEXT("Constraint '%s' has %d relink specs for %d targets"),
					*Con.Name.ToString(), Spec.Targets.Num(), Con.Targets.Num()));
			bSuccess = false;
			continue;
		}

		// Targetless constraints may still be relinked to a single new target
		if (Con.Targets.IsEmpty()) { Con.Targets.Emplace(NAME_None); }

		for (int32 i = 0; i < Con.Targets.Num(); i++)
		{
			const FString Empty;
			const FString& TargetSpec = Spec.bMarked ? Spec.GetTargetSpec(i) : Empty;
			const FName NewTarget = FindTarget(TargetSpec, Con.Targets[i].Bone);

			if (NewTarget.IsNone())
			{
				continue;
			}

			if (!InArmature.Contains(NewTarget))
			{
				OutReport.AddError(
					InBone, InRigKind, FString::Printf(
						TEXT("Cannot find bone '%s' to relink constraint '%s'"),
						*NewTarget.ToString(), *Con.Name.ToString()));
				bSuccess = false;
				continue;
			}

			RIGEX_LOG_VERBOSE(Naming, "Relink %s/%s: %s -> %s", *InBone.ToString(), *Spec.Label.ToString(), *Con.Targets[i].Bone.ToString(), *NewTarget.ToString());
			Con.Targets[i].Bone = NewTarget;
		}

		Con.Targets.RemoveAll([](const FRigExConstraintTarget& Target) { return Target.Bone.IsNone(); });
		Con.Name = Spec.Label;
	}

	return bSuccess;
}
