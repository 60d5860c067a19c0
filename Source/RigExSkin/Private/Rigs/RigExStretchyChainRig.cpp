// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Rigs/RigExStretchyChainRig.h"

#include "Chains/RigExChainBuilder.h"
#include "Core/RigExLog.h"
#include "Core/RigExSkinContext.h"
#include "Details/RigExParams.h"
#include "Parents/RigExNodeParents.h"

FRigExStretchyChainRig::FRigExStretchyChainRig()
	: FRigExChainRig(ERigExSkinRigKind::StretchyChain)
{
}

bool FRigExStretchyChainRig::IsDriverIndex(const int32 InIndex) const
{
	return InIndex == 0 || InIndex == Orgs.Num() || (StretchyDetails.HasPivot() && InIndex == StretchyDetails.PivotPos);
}

bool FRigExStretchyChainRig::InitializeDetails(FRigExSkinContext& InContext, const FRigExBone& InMetaBone)
{
	if (!FRigExChainRig::InitializeDetails(InContext, InMetaBone)) { return false; }

	const FRigExParamReader Reader(InMetaBone, InContext.GetReport(), GetRigType());
	StretchyDetails.Read(Reader);
	if (!StretchyDetails.Validate(Reader, Orgs.Num()) || !Reader.IsValid()) { return false; }

	TArray<FVector> Points;
	for (const FName Org : Orgs) { Points.Add(InContext.GetBone(Org).Head); }
	Points.Add(InContext.GetBone(Orgs.Last()).Tail);

	Projection = FRigExChainProjection(Points, StretchyDetails.Falloff.bAlongCurve);
	PivotFactor = StretchyDetails.HasPivot() ? Projection.GetFactor(Points[StretchyDetails.PivotPos], StretchyDetails.PivotPos) : 0;

	return true;
}

TSharedPtr<FRigExChainBuilder> FRigExStretchyChainRig::CreateBuilder()
{
	return MakeShared<FRigExStretchyChainBuilder>(this);
}

FRigExNodeEntry FRigExStretchyChainRig::MakeChainEntry(const FRigExSkinContext& InContext, const int32 InIndex)
{
	FRigExNodeEntry Entry = FRigExChainRig::MakeChainEntry(InContext, InIndex);

	if (Details.UsesBBones())
	{
		// Driver nodes expose their local motion through a reparent bone
		const FRigExFalloffDetails& Falloff = StretchyDetails.Falloff;
		if (InIndex == 0) { Entry.bNeedsReparent = Falloff.Start.IsEnabled(); }
		else if (InIndex == Orgs.Num()) { Entry.bNeedsReparent = Falloff.End.IsEnabled(); }
		else if (StretchyDetails.HasPivot() && InIndex == StretchyDetails.PivotPos) { Entry.bNeedsReparent = Falloff.Middle.IsEnabled(); }
	}

	return Entry;
}

TSharedPtr<FRigExNodeParent> FRigExStretchyChainRig::ExtendNodeParent(const FRigExSkinContext& InContext, const TSharedPtr<FRigExNodeParent>& InParent, const FRigExControlNode& InNode, const FRigExNodeEntry& InEntry, const bool bInMergeParentRotationAndScale)
{
	const int32 Index = InEntry.IndexInChain;
	if (InEntry.Rig != this || Index == 0 || Index == Orgs.Num() || !Details.UsesBBones()) { return InParent; }

	const FRigExFalloffDetails& Falloff = StretchyDetails.Falloff;
	const double Factor = Projection.GetFactor(InEntry.Point, Index);

	TSharedPtr<FRigExParentOffset> Offset = MakeShared<FRigExParentOffset>(InParent, InNode.GetIndex(), InEntry.Index, bInMergeParentRotationAndScale);

	auto AddDriver = [&](const FRigExNodeHandle InDriver, const TOptional<double>& InWeight)
	{
		if (!InWeight.IsSet() || InWeight.GetValue() <= 0) { return; }
		Offset->AddCopyLocalLocation(InContext.GetNode(InDriver).GetIndex(), InWeight.GetValue());
	};

	AddDriver(Nodes[0], Evaluator.Evaluate(Factor, Falloff.Start));
	AddDriver(Nodes.Last(), Evaluator.Evaluate(1 - Factor, Falloff.End));

	const int32 Pivot = StretchyDetails.PivotPos;
	if (StretchyDetails.HasPivot() && Index != Pivot)
	{
		const double SectionFactor = FRigExChainProjection::GetPivotFactor(Factor, PivotFactor, Index < Pivot);
		AddDriver(Nodes[Pivot], Evaluator.EvaluateFactor(SectionFactor, Falloff.Middle));
	}

	RIGEX_LOG_VERBOSE(Chain, "%s[%d]: factor %.4f, %d drivers", *BaseBone.ToString(), Index, Factor, Offset->GetDrivers().Num());

	TSharedPtr<FRigExNodeParent> Result = Offset;

	if (Index != Pivot && StretchyDetails.bPropagateToControls && (StretchyDetails.bPropagateTwist || StretchyDetails.bPropagateScale))
	{
		Result = MakeShared<FRigExParentChainPropagate>(Result, InNode.GetIndex(), InEntry.Index, static_cast<const FRigExStretchyChainBuilder*>(Builder.Get()), Index);
	}

	return Result;
}
