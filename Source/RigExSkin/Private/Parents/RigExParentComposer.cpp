// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Parents/RigExParentComposer.h"

#include "Core/RigExLog.h"
#include "Core/RigExSkinContext.h"
#include "Math/RigExMath.h"
#include "Naming/RigExBoneNaming.h"
#include "Nodes/RigExNodeRegistry.h"
#include "Parents/RigExNodeParents.h"
#include "Rigs/RigExSkinRig.h"

FRigExParentComposer::FRigExParentComposer(const TSharedRef<FRigExSkinContext>& InContext)
	: Context(InContext)
{
}

bool FRigExParentComposer::ShouldMergeParentRotationAndScale(const FRigExControlNode& InNode) const
{
	for (const int32 EntryIndex : InNode.GetEntries())
	{
		if (Context->GetEntry(EntryIndex).bMergeParentRotationAndScale) { return true; }
	}
	return false;
}

bool FRigExParentComposer::NeedsReparent(const FRigExControlNode& InNode) const
{
	for (const int32 EntryIndex : InNode.GetEntries())
	{
		if (Context->GetEntry(EntryIndex).bNeedsReparent) { return true; }
	}

	const FRigExNodeRegistry& Registry = Context->GetRegistry();
	for (const int32 QueryIndex : InNode.GetQueries())
	{
		if (Registry.GetQuery(FRigExQueryHandle(QueryIndex)).bNeedsReparent) { return true; }
	}

	return false;
}

TSharedPtr<FRigExNodeParent> FRigExParentComposer::BuildParent(FRigExControlNode& InNode, const FRigExNodeEntry& InEntry, const bool bMergeParentRotationAndScale) const
{
	if (const TSharedPtr<FRigExNodeParent> Existing = InNode.GetEntryParent(InEntry.Index)) { return Existing; }

	TSharedPtr<FRigExNodeParent> Result;

	if (InEntry.Rig)
	{
		Result = InEntry.Rig->BuildNodeParent(InEntry);

		// Outermost generator first, requesting generator last
		const TArray<FRigExSkinRig*> SkinRigs = InEntry.Rig->GetParentSkinRigs();
		for (int32 i = SkinRigs.Num() - 1; i >= 0; i--)
		{
			Result = SkinRigs[i]->ExtendNodeParent(*Context, Result, InNode, InEntry, bMergeParentRotationAndScale);
		}
	}
	else
	{
		Result = MakeShared<FRigExParentBone>(InEntry.ParentBone);
	}

	check(Result);

	for (const TSharedPtr<FRigExNodeParent>& Previous : InNode.ParentCache)
	{
		if (Previous->Equals(*Result))
		{
			Result = Previous;
			break;
		}
	}

	InNode.ParentCache.AddUnique(Result);
	InNode.EntryParents.Add(InEntry.Index, Result);

	return Result;
}

const FRigExComposedNode& FRigExParentComposer::Compose(FRigExControlNode& InNode) const
{
	checkf(InNode.IsResolved(), TEXT("Control node %d composed before ownership was resolved"), InNode.GetIndex());
	if (InNode.bComposed) { return InNode.Composed; }

	FRigExComposedNode& Composed = InNode.Composed;

	// Symmetric average over the group, the owner alone when it has no siblings
	TArray<FQuat> Rotations;
	double SizeSum = 0;
	for (const int32 EntryIndex : InNode.GetSymmetryGroup())
	{
		const FRigExNodeEntry& Entry = Context->GetEntry(EntryIndex);
		Rotations.Add(Entry.Rotation);
		SizeSum += Entry.Size;
	}

	Composed.Transform = FTransform(RigExMath::AverageRotations(Rotations), InNode.GetPoint());
	Composed.Size = SizeSum / InNode.GetSymmetryGroup().Num();
	Composed.bMergeParentRotationAndScale = ShouldMergeParentRotationAndScale(InNode);
	Composed.bNeedsReparent = NeedsReparent(InNode);

	// Transform is needed by layers built below
	InNode.bComposed = true;

	Composed.Parents.Reset();
	for (const int32 EntryIndex : InNode.GetSymmetryGroup())
	{
		Composed.Parents.AddUnique(BuildParent(InNode, Context->GetEntry(EntryIndex), Composed.bMergeParentRotationAndScale));
	}

	Composed.InheritMode = ERigExInheritScale::Average;
	if (Composed.Parents.Num() == 1) { Composed.InheritMode = Composed.Parents[0]->GetInheritScale(); }

	if (FRigExLog::WouldLog(ERigExLogCategory::Compose, ERigExLogVerbosity::Verbose))
	{
		FString ParentsString;
		for (const TSharedPtr<FRigExNodeParent>& Parent : Composed.Parents) { ParentsString += Parent->ToString() + TEXT(" "); }

		FRigExLog::Log(
			ERigExLogCategory::Compose, ERigExLogVerbosity::Verbose,
			FString::Printf(
				TEXT("Node %d: rotation %s, size %.4f, parents [ %s]"),
				InNode.GetIndex(), *Composed.GetRotation().ToString(), Composed.Size, *ParentsString));
	}

	return Composed;
}

void FRigExParentComposer::ComposeAll() const
{
	RIGEX_LOG_SECTION(Compose, "Compose");

	int32 NumMixed = 0;
	for (const TSharedPtr<FRigExControlNode>& Node : Context->GetRegistry().GetNodes())
	{
		if (Compose(*Node).Parents.Num() > 1) { NumMixed++; }
	}

	RIGEX_LOG_INFO(Compose, "Composed %d nodes, %d with mixed parents", Context->GetRegistry().NumNodes(), NumMixed);
}

void FRigExParentComposer::GenerateBones(FRigExControlNode& InNode) const
{
	const FRigExComposedNode& Composed = InNode.GetComposed();
	const FRigExNodeEntry& Owner = Context->GetEntry(InNode.GetOwner());
	FRigExArmature& Armature = Context->GetArmature();

	InNode.ControlBone = Context->CopyBone(Owner.Org, Owner.Name);

	FRigExBone& Control = Armature.GetChecked(InNode.ControlBone);
	Control.SetPlacement(Composed.GetLocation(), Composed.GetRotation(), Composed.Size);
	Control.bHidden = Owner.bHideLoneControl && !InNode.IsMerged();

	if (Composed.Parents.Num() > 1)
	{
		InNode.MixParentBone = Context->CopyBone(Owner.Org, RigExNaming::MakeDerivedName(Owner.Name, ERigExBoneRole::Mechanism, TEXT("_mix_parent")));
		Armature.GetChecked(InNode.MixParentBone).SetPlacement(Composed.GetLocation(), Composed.GetRotation(), Composed.Size * 0.5);
	}

	if (Composed.bNeedsReparent)
	{
		InNode.ReparentBone = Context->CopyBone(Owner.Org, RigExNaming::MakeDerivedName(Owner.Name, ERigExBoneRole::Mechanism, TEXT("_reparent")));
		Armature.GetChecked(InNode.ReparentBone).SetPlacement(Composed.GetLocation(), Composed.GetRotation(), Composed.Size * 0.25);
	}
}

void FRigExParentComposer::ParentBones(FRigExControlNode& InNode) const
{
	const FRigExComposedNode& Composed = InNode.GetComposed();

	if (!InNode.MixParentBone.IsNone())
	{
		Context->SetParent(InNode.MixParentBone, NAME_None);
		Context->SetParent(InNode.ControlBone, InNode.MixParentBone, ERigExInheritScale::Average);
	}
	else
	{
		Context->SetParent(InNode.ControlBone, Composed.Parents[0]->GetOutputBone(), Composed.InheritMode);
	}

	if (!InNode.ReparentBone.IsNone())
	{
		Context->SetParent(InNode.ReparentBone, InNode.GetParentOutputBone(), ERigExInheritScale::Average);
	}
}

void FRigExParentComposer::RigBones(FRigExControlNode& InNode) const
{
	const FRigExComposedNode& Composed = InNode.GetComposed();

	if (!InNode.MixParentBone.IsNone())
	{
		FRigExConstraint& Mix = Context->MakeConstraint(InNode.MixParentBone, ERigExConstraintKind::Armature, FName("mix_parents"));
		Mix.bPreserveVolume = true;

		const double Weight = 1.0 / Composed.Parents.Num();
		for (const TSharedPtr<FRigExNodeParent>& Parent : Composed.Parents) { Mix.Targets.Emplace(Parent->GetOutputBone(), Weight); }
	}

	if (!InNode.ReparentBone.IsNone())
	{
		FRigExConstraint& Copy = Context->MakeConstraint(InNode.ReparentBone, ERigExConstraintKind::CopyTransforms, FName("copy_control"), InNode.ControlBone);
		Copy.SetSpace(ERigExSpace::Local);
	}
}
