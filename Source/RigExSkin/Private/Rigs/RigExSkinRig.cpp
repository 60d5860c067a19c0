// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Rigs/RigExSkinRig.h"

#include "Armature/RigExArmature.h"
#include "Core/RigExSkinContext.h"
#include "Parents/RigExNodeParents.h"
#include "Rigs/RigExAnchorRig.h"
#include "Rigs/RigExChainRig.h"
#include "Rigs/RigExGlueRig.h"
#include "Rigs/RigExStretchyChainRig.h"

FRigExSkinRig::FRigExSkinRig(const ERigExSkinRigKind InKind)
	: Kind(InKind)
{
}

void FRigExSkinRig::Bind(const FName InMetaBone, const FName InBaseBone, FRigExSkinRig* InParentRig, const FRigExArmature& InRig)
{
	MetaBone = InMetaBone;
	BaseBone = InBaseBone;
	ParentRig = InParentRig;
	RigParentBone = InRig.GetChecked(BaseBone).Parent;
}

TArray<FRigExSkinRig*> FRigExSkinRig::GetParentSkinRigs()
{
	TArray<FRigExSkinRig*> Result;
	for (FRigExSkinRig* Current = this; Current; Current = Current->ParentRig) { Result.Add(Current); }
	return Result;
}

int32 FRigExSkinRig::GetParentDepth() const
{
	int32 Depth = 0;
	for (const FRigExSkinRig* Current = ParentRig; Current; Current = Current->ParentRig) { Depth++; }
	return Depth;
}

TSharedPtr<FRigExNodeParent> FRigExSkinRig::BuildNodeParent(const FRigExNodeEntry& InEntry)
{
	return MakeShared<FRigExParentBone>(BaseBone);
}

TSharedPtr<FRigExNodeParent> FRigExSkinRig::ExtendNodeParent(const FRigExSkinContext& InContext, const TSharedPtr<FRigExNodeParent>& InParent, const FRigExControlNode& InNode, const FRigExNodeEntry& InEntry, const bool bInMergeParentRotationAndScale)
{
	return InParent;
}

FQuat FRigExSkinRig::GetControlNodeRotation(const FRigExSkinContext& InContext) const
{
	return InContext.GetBone(BaseBone).GetRotation();
}

FQuat FRigExSkinRig::GetFinalControlNodeRotation(const FRigExSkinContext& InContext) const
{
	const FRigExSkinRig* Rig = this;
	for (int32 Index = RotationIndex; Index > 0 && Rig->ParentRig; Index--) { Rig = Rig->ParentRig; }
	return Rig->GetControlNodeRotation(InContext);
}

FRigExNodeEntry FRigExSkinRig::MakeEntry(const FRigExSkinContext& InContext, const FName InOrg, const FName InName, const FVector& InPoint, const int32 InIndex)
{
	FRigExNodeEntry Entry;
	Entry.Rig = this;
	Entry.Kind = Kind;
	Entry.ChainName = BaseBone;
	Entry.Org = InOrg;
	Entry.Name = InName;
	Entry.IndexInChain = InIndex;
	Entry.Point = InPoint;
	Entry.Rotation = GetFinalControlNodeRotation(InContext);
	Entry.Size = InContext.GetBone(InOrg).GetLength();
	Entry.ParentDepth = GetParentDepth();
	Entry.bMergeParentRotationAndScale = bMergeParentRotationAndScale;
	Entry.ParentBone = RigParentBone;
	Entry.MergeDomain = InContext.MergeDomain;
	return Entry;
}

FRigExSkinNodeRig::FRigExSkinNodeRig(const ERigExSkinRigKind InKind)
	: FRigExSkinRig(InKind)
{
}

TSharedPtr<FRigExNodeParent> FRigExSkinNodeRig::BuildNodeParent(const FRigExNodeEntry& InEntry)
{
	if (ParentRig) { return ParentRig->BuildNodeParent(InEntry); }
	return MakeShared<FRigExParentBone>(RigParentBone);
}

namespace RigExSkin
{
	TSharedPtr<FRigExSkinRig> CreateRig(const ERigExSkinRigKind InKind)
	{
		switch (InKind)
		{
		case ERigExSkinRigKind::Anchor: return MakeShared<FRigExAnchorRig>();
		case ERigExSkinRigKind::BasicChain: return MakeShared<FRigExChainRig>();
		case ERigExSkinRigKind::StretchyChain: return MakeShared<FRigExStretchyChainRig>();
		case ERigExSkinRigKind::Glue: return MakeShared<FRigExGlueRig>();
		default: return nullptr;
		}
	}
}
