// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Rigs/RigExAnchorRig.h"

#include "Armature/RigExArmature.h"
#include "Core/RigExSkinContext.h"
#include "Details/RigExParams.h"
#include "Naming/RigExBoneNaming.h"
#include "Nodes/RigExNodeRegistry.h"

FRigExAnchorRig::FRigExAnchorRig()
	: FRigExSkinNodeRig(ERigExSkinRigKind::Anchor)
{
}

bool FRigExAnchorRig::Initialize(FRigExSkinContext& InContext, const FRigExBone& InMetaBone)
{
	const FRigExParamReader Reader(InMetaBone, InContext.GetReport(), GetRigType());
	Details.Read(Reader);
	if (!Details.Validate(Reader) || !Reader.IsValid()) { return false; }

	Orgs = {BaseBone};
	RotationIndex = Details.RotationIndex;
	bMergeParentRotationAndScale = Details.bMergeParentRotationAndScale;

	return true;
}

void FRigExAnchorRig::CollectNodes(FRigExSkinContext& InContext)
{
	const FRigExBone& Bone = InContext.GetBone(BaseBone);

	FRigExNodeEntry Entry = MakeEntry(InContext, BaseBone, RigExNaming::MakeDerivedName(BaseBone, ERigExBoneRole::Control), Bone.Head, 0);
	Entry.bCanMerge = false;
	Entry.bHideLoneControl = Details.bHideUnlessMerged;

	Node = InContext.GetRegistry().Register(Entry);
}

void FRigExAnchorRig::GenerateBones(FRigExSkinContext& InContext)
{
	if (!Details.bMakeDeform) { return; }

	DeformBone = InContext.CopyBone(BaseBone, RigExNaming::MakeDerivedName(BaseBone, ERigExBoneRole::Deform));
	InContext.GetBone(DeformBone).bDeform = true;
}

void FRigExAnchorRig::ParentBones(FRigExSkinContext& InContext)
{
	InContext.SetParent(BaseBone, InContext.GetNode(Node).ControlBone);
	if (!DeformBone.IsNone()) { InContext.SetParent(DeformBone, BaseBone); }
}
