// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Rigs/RigExGlueRig.h"

#include "Armature/RigExArmature.h"
#include "Armature/RigExRelink.h"
#include "Core/RigExLog.h"
#include "Core/RigExSkinContext.h"
#include "Details/RigExParams.h"
#include "Nodes/RigExNodeRegistry.h"

FRigExGlueRig::FRigExGlueRig()
	: FRigExSkinRig(ERigExSkinRigKind::Glue)
{
}

bool FRigExGlueRig::Initialize(FRigExSkinContext& InContext, const FRigExBone& InMetaBone)
{
	const FRigExParamReader Reader(InMetaBone, InContext.GetReport(), GetRigType());
	Details.Read(Reader);
	if (!Reader.IsValid()) { return false; }

	Orgs = {BaseBone};
	return true;
}

void FRigExGlueRig::CollectNodes(FRigExSkinContext& InContext)
{
	FRigExNodeRegistry& Registry = InContext.GetRegistry();
	const FRigExBone& Bone = InContext.GetBone(BaseBone);

	FRigExQueryEntry Query;
	Query.Rig = this;
	Query.ChainName = BaseBone;
	Query.Org = BaseBone;
	Query.MergeDomain = InContext.MergeDomain;

	Query.Point = Bone.Head;
	Query.bNeedsReparent = Details.HeadMode == ERigExGlueHeadMode::Reparent;
	HeadPosition = Registry.RegisterQuery(Query);

	Query.bNeedsReparent = false;
	HeadConstraint = Registry.RegisterQuery(Query);

	if (Details.UsesTail())
	{
		Query.Point = Bone.Tail;
		Query.bNeedsReparent = Details.bTailReparent;
		TailPosition = Registry.RegisterQuery(Query);
	}
}

FName FRigExGlueRig::GetTailOutputBone(const FRigExSkinContext& InContext) const
{
	if (!TailPosition.IsValid()) { return NAME_None; }

	const FRigExControlNode& Node = InContext.GetNode(TailPosition);
	return Details.bTailReparent ? Node.ReparentBone : Node.ControlBone;
}

void FRigExGlueRig::GenerateBones(FRigExSkinContext& InContext)
{
	if (Details.HeadMode != ERigExGlueHeadMode::Mirror) { return; }

	// Sibling of the control, so it starts out at the same transform
	const FRigExComposedNode& Composed = InContext.GetNode(HeadPosition).GetComposed();
	FRigExBone& Bone = InContext.GetBone(BaseBone);
	Bone.SetPlacement(Composed.GetLocation(), Composed.GetRotation(), Bone.GetLength());
}

void FRigExGlueRig::ParentBones(FRigExSkinContext& InContext)
{
	const FRigExControlNode& Node = InContext.GetNode(HeadPosition);

	switch (Details.HeadMode)
	{
	case ERigExGlueHeadMode::Child:
		InContext.SetParent(BaseBone, Node.ControlBone);
		break;
	case ERigExGlueHeadMode::Mirror:
		InContext.SetParent(BaseBone, Node.GetParentOutputBone(), ERigExInheritScale::Average);
		break;
	case ERigExGlueHeadMode::Reparent:
		break;
	}
}

void FRigExGlueRig::RigBones(FRigExSkinContext& InContext)
{
	FRigExArmature& Armature = InContext.GetArmature();
	const FRigExControlNode& HeadNode = InContext.GetNode(HeadConstraint);

	if (Details.bRelinkConstraints)
	{
		const FName TailOutput = GetTailOutputBone(InContext);

		FRigExConstraintRelinker Relinker;
		Relinker.bRelinkUnmarked = Details.UsesTail();
		Relinker.TargetOverride = [TailOutput](const FString& InSpec, const FName InOldTarget)
		{
			if (InSpec == TEXT("TARGET") || (InSpec.IsEmpty() && InOldTarget.IsNone())) { return TailOutput; }
			return FName(NAME_None);
		};

		if (!Relinker.RelinkBone(Armature, BaseBone, GetRigType(), InContext.GetReport())) { return; }
	}

	// The glue bone constraints act on the control at its head
	FRigExBone& Bone = InContext.GetBone(BaseBone);
	if (!Bone.Constraints.IsEmpty())
	{
		RIGEX_LOG_VERBOSE(Generator, "%s: moving %d constraints to %s", *BaseBone.ToString(), Bone.Constraints.Num(), *HeadNode.ControlBone.ToString());
		InContext.GetBone(HeadNode.ControlBone).Constraints.Append(MoveTemp(Bone.Constraints));
		Bone.Constraints.Reset();
	}

	if (Details.HeadMode == ERigExGlueHeadMode::Mirror)
	{
		InContext.MakeConstraint(BaseBone, ERigExConstraintKind::CopyTransforms, FName("copy_control"), InContext.GetNode(HeadPosition).ControlBone);
	}
	else if (Details.HeadMode == ERigExGlueHeadMode::Reparent)
	{
		const FRigExControlNode& Node = InContext.GetNode(HeadPosition);
		checkf(!Node.ReparentBone.IsNone(), TEXT("Node %d has no reparent bone for glue %s"), Node.GetIndex(), *BaseBone.ToString());

		FRigExConstraint& Copy = InContext.MakeConstraint(BaseBone, ERigExConstraintKind::CopyTransforms, FName("copy_reparent"), Node.ReparentBone);
		Copy.SetSpace(ERigExSpace::Local);
	}
}
