// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Armature/RigExConstraint.h"

enum class ERigExInheritScale : uint8
{
	Full = 0,
	Average,
	None,
};

enum class ERigExBBoneHandle : uint8
{
	Auto = 0,
	Absolute,
	Relative,
	Tangent,
};

enum class ERigExRotationMode : uint8
{
	Quaternion = 0,
	YXZ,
};

/**
 * Rest-pose bone record, plus the rig data attached to it.
 * Orientation follows the usual bone convention: local Y runs head to tail, roll spins around it.
 */
struct RIGEXCORE_API FRigExBone
{
	FName Name = NAME_None;
	FName Parent = NAME_None;

	FVector Head = FVector::ZeroVector;
	FVector Tail = FVector(0, 1, 0);
	double Roll = 0;

	bool bConnected = false;
	bool bDeform = false;
	bool bInheritRotation = true;
	ERigExInheritScale InheritScale = ERigExInheritScale::Full;
	ERigExRotationMode RotationMode = ERigExRotationMode::Quaternion;

	bool bHidden = false;

	int32 BBoneSegments = 1;
	ERigExBBoneHandle HandleStartType = ERigExBBoneHandle::Auto;
	ERigExBBoneHandle HandleEndType = ERigExBBoneHandle::Auto;
	FName HandleStart = NAME_None;
	FName HandleEnd = NAME_None;
	double EaseIn = 1;
	double EaseOut = 1;

	/** Generator type tag, e.g. skin.basic_chain. Metarig only. */
	FName RigType = NAME_None;

	/** Raw generator parameters. Metarig only. */
	TMap<FName, FString> Params;

	TArray<FRigExConstraint> Constraints;
	TArray<FRigExDriver> Drivers;

	FRigExBone() = default;

	FRigExBone(const FName InName, const FVector& InHead, const FVector& InTail, const double InRoll = 0)
		: Name(InName), Head(InHead), Tail(InTail), Roll(InRoll)
	{
	}

	double GetLength() const { return FVector::Dist(Head, Tail); }
	FVector GetDirection() const { return (Tail - Head).GetSafeNormal(); }

	FQuat GetRotation() const;

	/** Place the bone at InHead with the given orientation and length */
	void SetPlacement(const FVector& InHead, const FQuat& InRotation, const double InLength);

	FRigExConstraint& AddConstraint(const ERigExConstraintKind InKind, const FName InName, const FName InTarget = NAME_None);

	const FRigExConstraint* FindConstraint(const FName InName) const;
	const FRigExConstraint* FindConstraint(const ERigExConstraintKind InKind) const;
	int32 CountConstraints(const ERigExConstraintKind InKind) const;

	const FRigExDriver* FindDriver(const FName InProperty, const int32 InIndex) const;

	bool HasRigType() const { return !RigType.IsNone(); }
};

/**
 * Ordered bone collection with name lookup.
 * Serves as both the input metarig and the generated rig.
 */
class RIGEXCORE_API FRigExArmature final : public TSharedFromThis<FRigExArmature>
{
	TArray<FRigExBone> Bones;
	TMap<FName, int32> BoneIndices;

public:
	FRigExArmature() = default;

	int32 Num() const { return Bones.Num(); }
	bool Contains(const FName InName) const { return BoneIndices.Contains(InName); }

	/** Adds a bone; a name collision gets a numeric suffix. Returns the bone actually created. */
	FRigExBone& AddBone(const FRigExBone& InBone);
	FRigExBone& AddBone(const FName InName, const FVector& InHead, const FVector& InTail, const double InRoll = 0);

	/** Copy geometry (not rig data) of an existing bone under a new name. Returns the final name. */
	FName CopyBone(const FName InSource, const FName InNewName, const bool bCopyBBone = false);

	FRigExBone* Find(const FName InName);
	const FRigExBone* Find(const FName InName) const;

	FRigExBone& GetChecked(const FName InName);
	const FRigExBone& GetChecked(const FName InName) const;

	const TArray<FRigExBone>& GetBones() const { return Bones; }

	/** Rename a bone and every reference to it from parents, handles and constraint targets */
	bool RenameBone(const FName InOldName, const FName InNewName);

	void SetParent(const FName InChild, const FName InParent, const ERigExInheritScale InInheritScale = ERigExInheritScale::Full, const bool bConnected = false);

	/** Number of ancestors; roots have depth 0 */
	int32 GetDepth(const FName InName) const;

	/** InName followed by its chain of single connected children */
	TArray<FName> GetConnectedChain(const FName InName) const;

	/** Closest strict ancestor carrying a generator type tag, or NAME_None */
	FName FindTaggedAncestor(const FName InName) const;

	FName MakeUniqueName(const FName InName) const;

	TSharedRef<FRigExArmature> Duplicate() const;

	void Reset();
};
