// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Armature/RigExArmature.h"

#include "Math/RigExMath.h"

#pragma region FRigExBone

FQuat FRigExBone::GetRotation() const
{
	return RigExMath::MakeBoneRotation(Head, Tail, Roll);
}

void FRigExBone::SetPlacement(const FVector& InHead, const FQuat& InRotation, const double InLength)
{
	Head = InHead;
	Tail = Head + InRotation.RotateVector(RigExMath::BoneAxis) * FMath::Max(InLength, SMALL_NUMBER);
	Roll = RigExMath::GetRollFromRotation(InRotation);
}

FRigExConstraint& FRigExBone::AddConstraint(const ERigExConstraintKind InKind, const FName InName, const FName InTarget)
{
	return Constraints.Emplace_GetRef(InKind, InName, InTarget);
}

const FRigExConstraint* FRigExBone::FindConstraint(const FName InName) const
{
	return Constraints.FindByPredicate([&](const FRigExConstraint& Con) { return Con.Name == InName; });
}

const FRigExConstraint* FRigExBone::FindConstraint(const ERigExConstraintKind InKind) const
{
	return Constraints.FindByPredicate([&](const FRigExConstraint& Con) { return Con.Kind == InKind; });
}

int32 FRigExBone::CountConstraints(const ERigExConstraintKind InKind) const
{
	int32 Count = 0;
	for (const FRigExConstraint& Con : Constraints) { if (Con.Kind == InKind) { Count++; } }
	return Count;
}

const FRigExDriver* FRigExBone::FindDriver(const FName InProperty, const int32 InIndex) const
{
	return Drivers.FindByPredicate([&](const FRigExDriver& Driver) { return Driver.Property == InProperty && Driver.Index == InIndex; });
}

#pragma endregion

#pragma region FRigExArmature

FRigExBone& FRigExArmature::AddBone(const FRigExBone& InBone)
{
	const FName UniqueName = MakeUniqueName(InBone.Name);
	const int32 Index = Bones.Add(InBone);
	Bones[Index].Name = UniqueName;
	BoneIndices.Add(UniqueName, Index);
	return Bones[Index];
}

FRigExBone& FRigExArmature::AddBone(const FName InName, const FVector& InHead, const FVector& InTail, const double InRoll)
{
	return AddBone(FRigExBone(InName, InHead, InTail, InRoll));
}

FName FRigExArmature::CopyBone(const FName InSource, const FName InNewName, const bool bCopyBBone)
{
	const FRigExBone& Source = GetChecked(InSource);

	FRigExBone Copy(InNewName, Source.Head, Source.Tail, Source.Roll);
	Copy.Parent = Source.Parent;
	Copy.InheritScale = Source.InheritScale;
	Copy.bInheritRotation = Source.bInheritRotation;

	if (bCopyBBone)
	{
		Copy.BBoneSegments = Source.BBoneSegments;
		Copy.EaseIn = Source.EaseIn;
		Copy.EaseOut = Source.EaseOut;
	}

	// Source reference may be invalidated by the add
	return AddBone(Copy).Name;
}

FRigExBone* FRigExArmature::Find(const FName InName)
{
	const int32* Index = BoneIndices.Find(InName);
	return Index ? &Bones[*Index] : nullptr;
}

const FRigExBone* FRigExArmature::Find(const FName InName) const
{
	const int32* Index = BoneIndices.Find(InName);
	return Index ? &Bones[*Index] : nullptr;
}

FRigExBone& FRigExArmature::GetChecked(const FName InName)
{
	FRigExBone* Bone = Find(InName);
	checkf(Bone, TEXT("Bone '%s' does not exist"), *InName.ToString());
	return *Bone;
}

const FRigExBone& FRigExArmature::GetChecked(const FName InName) const
{
	const FRigExBone* Bone = Find(InName);
	checkf(Bone, TEXT("Bone '%s' does not exist"), *InName.ToString());
	return *Bone;
}

bool FRigExArmature::RenameBone(const FName InOldName, const FName InNewName)
{
	if (InOldName == InNewName) { return true; }
	if (Contains(InNewName)) { return false; }

	int32 Index = INDEX_NONE;
	if (!BoneIndices.RemoveAndCopyValue(InOldName, Index)) { return false; }

	Bones[Index].Name = InNewName;
	BoneIndices.Add(InNewName, Index);

	for (FRigExBone& Bone : Bones)
	{
		if (Bone.Parent == InOldName) { Bone.Parent = InNewName; }
		if (Bone.HandleStart == InOldName) { Bone.HandleStart = InNewName; }
		if (Bone.HandleEnd == InOldName) { Bone.HandleEnd = InNewName; }

		for (FRigExConstraint& Con : Bone.Constraints)
		{
			for (FRigExConstraintTarget& Target : Con.Targets) { if (Target.Bone == InOldName) { Target.Bone = InNewName; } }
		}

		for (FRigExDriver& Driver : Bone.Drivers)
		{
			for (FRigExDriverVariable& Var : Driver.Variables) { if (Var.Bone == InOldName) { Var.Bone = InNewName; } }
		}
	}

	return true;
}

void FRigExArmature::SetParent(const FName InChild, const FName InParent, const ERigExInheritScale InInheritScale, const bool bConnected)
{
	FRigExBone& Child = GetChecked(InChild);
	check(InParent.IsNone() || Contains(InParent));
	check(InChild != InParent);

	Child.Parent = InParent;
	Child.InheritScale = InInheritScale;
	Child.bConnected = bConnected && !InParent.IsNone();
}

int32 FRigExArmature::GetDepth(const FName InName) const
{
	int32 Depth = 0;
	const FRigExBone* Bone = Find(InName);

	while (Bone && !Bone->Parent.IsNone())
	{
		Depth++;
		Bone = Find(Bone->Parent);
		checkf(Depth <= Bones.Num(), TEXT("Parent cycle through '%s'"), *InName.ToString());
	}

	return Depth;
}

TArray<FName> FRigExArmature::GetConnectedChain(const FName InName) const
{
	TArray<FName> Chain;
	if (!Contains(InName)) { return Chain; }

	Chain.Add(InName);
	FName Current = InName;

	while (true)
	{
		FName Next = NAME_None;
		for (const FRigExBone& Bone : Bones)
		{
			// Stop at children that start their own rig
			if (Bone.Parent == Current && Bone.bConnected && !Bone.HasRigType())
			{
				Next = Bone.Name;
				break;
			}
		}

		if (Next.IsNone() || Chain.Contains(Next)) { break; }
		Chain.Add(Next);
		Current = Next;
	}

	return Chain;
}

FName FRigExArmature::FindTaggedAncestor(const FName InName) const
{
	const FRigExBone* Bone = Find(InName);
	int32 Guard = 0;

	while (Bone && !Bone->Parent.IsNone() && Guard++ <= Bones.Num())
	{
		Bone = Find(Bone->Parent);
		if (Bone && Bone->HasRigType()) { return Bone->Name; }
	}

	return NAME_None;
}

FName FRigExArmature::MakeUniqueName(const FName InName) const
{
	if (!Contains(InName)) { return InName; }

	const FString Base = InName.ToString();
	for (int32 i = 1;; i++)
	{
		const FName Candidate = FName(FString::Printf(TEXT("%s.%03d"), *Base, i));
		if (!Contains(Candidate)) { return Candidate; }
	}
}

TSharedRef<FRigExArmature> FRigExArmature::Duplicate() const
{
	TSharedRef<FRigExArmature> Copy = MakeShared<FRigExArmature>();
	Copy->Bones = Bones;
	Copy->BoneIndices = BoneIndices;
	return Copy;
}

void FRigExArmature::Reset()
{
	Bones.Reset();
	BoneIndices.Reset();
}

#pragma endregion
