// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

enum class ERigExConstraintKind : uint8
{
	CopyLocation = 0,
	CopyRotation,
	CopyScale,
	CopyTransforms,
	DampedTrack,
	StretchTo,
	LimitRotation,
	Armature,
	ChildOf,
};

enum class ERigExSpace : uint8
{
	World = 0,
	Local,
	OwnerLocal,
	Pose,
};

enum class ERigExMixMode : uint8
{
	Replace = 0,
	BeforeFull,
	Before,
	After,
	Offset,
};

struct RIGEXCORE_API FRigExConstraintTarget
{
	FName Bone = NAME_None;
	double Weight = 1;

	FRigExConstraintTarget() = default;

	explicit FRigExConstraintTarget(const FName InBone, const double InWeight = 1)
		: Bone(InBone), Weight(InWeight)
	{
	}

	bool operator==(const FRigExConstraintTarget& Other) const { return Bone == Other.Bone && Weight == Other.Weight; }
};

/**
 * Declarative constraint record. The host evaluates it; we only describe it.
 * A name of the form "Label@SPEC[,SPEC...]" carries relink instructions for its targets.
 */
struct RIGEXCORE_API FRigExConstraint
{
	ERigExConstraintKind Kind = ERigExConstraintKind::CopyTransforms;
	FName Name = NAME_None;

	TArray<FRigExConstraintTarget> Targets;

	ERigExSpace OwnerSpace = ERigExSpace::World;
	ERigExSpace TargetSpace = ERigExSpace::World;
	ERigExMixMode MixMode = ERigExMixMode::Replace;

	double Influence = 1;

	// Copy Scale
	double Power = 1;
	bool bUseOffset = false;

	bool bUseX = true;
	bool bUseY = true;
	bool bUseZ = true;

	// Armature
	bool bPreserveVolume = false;

	// Stretch To
	bool bKeepSwingY = false;

	// Limit Rotation
	bool bLimitX = false;
	bool bLimitY = false;
	bool bLimitZ = false;

	FRigExConstraint() = default;

	FRigExConstraint(const ERigExConstraintKind InKind, const FName InName)
		: Kind(InKind), Name(InName)
	{
	}

	FRigExConstraint(const ERigExConstraintKind InKind, const FName InName, const FName InTarget)
		: Kind(InKind), Name(InName)
	{
		if (!InTarget.IsNone()) { Targets.Emplace(InTarget); }
	}

	FName GetTarget() const { return Targets.IsEmpty() ? NAME_None : Targets[0].Bone; }

	void SetSpace(const ERigExSpace InSpace)
	{
		OwnerSpace = InSpace;
		TargetSpace = InSpace;
	}

	static const TCHAR* GetKindName(const ERigExConstraintKind InKind);
};

enum class ERigExTransformChannel : uint8
{
	LocX = 0,
	LocY,
	LocZ,
	RotX,
	RotY,
	RotZ,
	ScaleX,
	ScaleY,
	ScaleZ,
};

struct RIGEXCORE_API FRigExDriverVariable
{
	FName Name = NAME_None;
	FName Bone = NAME_None;
	ERigExTransformChannel Channel = ERigExTransformChannel::RotY;
	ERigExSpace Space = ERigExSpace::Local;

	/** Rotation read as swing + twist around Y */
	bool bSwingTwistY = false;
};

/** Expression driving one component of a bone property */
struct RIGEXCORE_API FRigExDriver
{
	FName Property = NAME_None;
	int32 Index = -1;
	FString Expression;
	TArray<FRigExDriverVariable> Variables;

	const FRigExDriverVariable* FindVariable(const FName InName) const
	{
		return Variables.FindByPredicate([&](const FRigExDriverVariable& Var) { return Var.Name == InName; });
	}
};
