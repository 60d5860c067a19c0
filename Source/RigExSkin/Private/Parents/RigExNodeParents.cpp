// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Parents/RigExNodeParents.h"

#include "Chains/RigExChainBuilder.h"
#include "Core/RigExSkinContext.h"
#include "Naming/RigExBoneNaming.h"
#include "Nodes/RigExNodeRegistry.h"

#pragma region FRigExParentBone

FRigExParentBone::FRigExParentBone(const FName InBone)
{
	OutputBone = InBone;
}

bool FRigExParentBone::Equals(const FRigExNodeParent& Other) const
{
	return Other.GetKind() == ERigExNodeParentKind::Bone && Other.GetOutputBone() == OutputBone;
}

FString FRigExParentBone::ToString() const
{
	return FString::Printf(TEXT("Bone(%s)"), *OutputBone.ToString());
}

#pragma endregion

#pragma region FRigExParentLayer

FRigExParentLayer::FRigExParentLayer(const TSharedPtr<FRigExNodeParent>& InInner, const int32 InNode, const int32 InEntry)
	: Inner(InInner), Node(InNode), Entry(InEntry)
{
	check(Inner);
}

bool FRigExParentLayer::InnerEquals(const FRigExParentLayer& Other) const
{
	return Inner == Other.Inner || Inner->Equals(*Other.Inner);
}

void FRigExParentLayer::GenerateBones(const FRigExSkinContext& InContext)
{
	const FRigExNodeEntry& NodeEntry = InContext.GetEntry(Entry);
	const FRigExControlNode& ControlNode = *InContext.GetRegistry().GetNode(Node);
	const FRigExComposedNode& Composed = ControlNode.GetComposed();

	OutputBone = InContext.CopyBone(NodeEntry.Org, RigExNaming::MakeDerivedName(NodeEntry.Name, ERigExBoneRole::Mechanism, GetBoneSuffix()));
	InContext.GetBone(OutputBone).SetPlacement(Composed.GetLocation(), Composed.GetRotation(), Composed.Size * 0.5);
}

void FRigExParentLayer::ParentBones(const FRigExSkinContext& InContext)
{
	InContext.SetParent(OutputBone, Inner->GetOutputBone(), ERigExInheritScale::Average);
}

#pragma endregion

#pragma region FRigExParentOffset

FRigExParentOffset::FRigExParentOffset(const TSharedPtr<FRigExNodeParent>& InInner, const int32 InNode, const int32 InEntry, const bool bInCopyFullTransform)
	: FRigExParentLayer(InInner, InNode, InEntry), bCopyFullTransform(bInCopyFullTransform)
{
}

void FRigExParentOffset::AddCopyLocalLocation(const int32 InDriverNode, const double InInfluence)
{
	Drivers.Add(FDriver{InDriverNode, InInfluence});
}

bool FRigExParentOffset::Equals(const FRigExNodeParent& Other) const
{
	if (Other.GetKind() != ERigExNodeParentKind::Offset) { return false; }

	const FRigExParentOffset& OtherOffset = static_cast<const FRigExParentOffset&>(Other);
	if (bCopyFullTransform != OtherOffset.bCopyFullTransform || Drivers.Num() != OtherOffset.Drivers.Num()) { return false; }

	for (int32 i = 0; i < Drivers.Num(); i++)
	{
		if (Drivers[i].Node != OtherOffset.Drivers[i].Node) { return false; }
		if (!FMath::IsNearlyEqual(Drivers[i].Influence, OtherOffset.Drivers[i].Influence)) { return false; }
	}

	return InnerEquals(OtherOffset);
}

FString FRigExParentOffset::ToString() const
{
	FString Result = FString::Printf(TEXT("Offset(%s"), *Inner->ToString());
	for (const FDriver& Driver : Drivers) { Result += FString::Printf(TEXT(", %d:%.3f"), Driver.Node, Driver.Influence); }
	return Result + TEXT(")");
}

void FRigExParentOffset::RigBones(const FRigExSkinContext& InContext)
{
	for (int32 i = 0; i < Drivers.Num(); i++)
	{
		const FRigExControlNode& DriverNode = *InContext.GetRegistry().GetNode(Drivers[i].Node);
		checkf(!DriverNode.ReparentBone.IsNone(), TEXT("Falloff driver node %d has no reparent bone"), Drivers[i].Node);

		const FName Name(*FString::Printf(TEXT("offset_%d"), i));

		if (bCopyFullTransform)
		{
			FRigExConstraint& Con = InContext.MakeConstraint(OutputBone, ERigExConstraintKind::CopyTransforms, Name, DriverNode.ReparentBone);
			Con.SetSpace(ERigExSpace::Local);
			Con.MixMode = ERigExMixMode::Before;
			Con.Influence = Drivers[i].Influence;
		}
		else
		{
			FRigExConstraint& Con = InContext.MakeConstraint(OutputBone, ERigExConstraintKind::CopyLocation, Name, DriverNode.ReparentBone);
			Con.SetSpace(ERigExSpace::Local);
			Con.bUseOffset = true;
			Con.Influence = Drivers[i].Influence;
		}
	}
}

#pragma endregion

#pragma region FRigExParentChainPropagate

FRigExParentChainPropagate::FRigExParentChainPropagate(const TSharedPtr<FRigExNodeParent>& InInner, const int32 InNode, const int32 InEntry, const FRigExStretchyChainBuilder* InBuilder, const int32 InIndexInChain)
	: FRigExParentLayer(InInner, InNode, InEntry), Builder(InBuilder), IndexInChain(InIndexInChain)
{
	check(Builder);
}

bool FRigExParentChainPropagate::Equals(const FRigExNodeParent& Other) const
{
	if (Other.GetKind() != ERigExNodeParentKind::ChainPropagate) { return false; }

	const FRigExParentChainPropagate& OtherPropagate = static_cast<const FRigExParentChainPropagate&>(Other);
	return Builder == OtherPropagate.Builder && IndexInChain == OtherPropagate.IndexInChain && InnerEquals(OtherPropagate);
}

FString FRigExParentChainPropagate::ToString() const
{
	return FString::Printf(TEXT("Propagate(%s, #%d)"), *Inner->ToString(), IndexInChain);
}

void FRigExParentChainPropagate::GenerateBones(const FRigExSkinContext& InContext)
{
	const FName Handle = Builder->GetHandleBone(IndexInChain);
	OutputBone = InContext.CopyBone(Handle, RigExNaming::MakeDerivedName(Handle, ERigExBoneRole::Mechanism, GetBoneSuffix()));
}

void FRigExParentChainPropagate::RigBones(const FRigExSkinContext& InContext)
{
	Builder->RigPropagate(InContext, OutputBone, IndexInChain);
}

#pragma endregion
