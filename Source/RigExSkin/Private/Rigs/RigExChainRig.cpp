// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Rigs/RigExChainRig.h"

#include "Armature/RigExArmature.h"
#include "Chains/RigExChainBuilder.h"
#include "Core/RigExLog.h"
#include "Core/RigExSkinContext.h"
#include "Details/RigExParams.h"
#include "Math/RigExMath.h"
#include "Naming/RigExBoneNaming.h"
#include "Nodes/RigExNodeRegistry.h"

FRigExChainRig::FRigExChainRig()
	: FRigExChainRig(ERigExSkinRigKind::BasicChain)
{
}

FRigExChainRig::FRigExChainRig(const ERigExSkinRigKind InKind)
	: FRigExSkinNodeRig(InKind)
{
}

bool FRigExChainRig::Initialize(FRigExSkinContext& InContext, const FRigExBone& InMetaBone)
{
	check(InContext.Metarig);

	Orgs.Reset();
	for (const FName Name : InContext.Metarig->GetConnectedChain(MetaBone)) { Orgs.Add(RigExNaming::MakeOrgName(Name)); }

	if (!InitializeDetails(InContext, InMetaBone)) { return false; }

	RotationIndex = Details.RotationIndex;
	bMergeParentRotationAndScale = Details.bMergeParentRotationAndScale;

	double LengthSum = 0;
	for (const FName Org : Orgs) { LengthSum += InContext.GetBone(Org).GetLength(); }
	AverageLength = LengthSum / Orgs.Num();

	const FRigExBone& First = InContext.GetBone(Orgs[0]);
	const FRigExBone& Last = InContext.GetBone(Orgs.Last());
	ChainRotation = RigExMath::ComputeChainOrientation(First.Head, First.Tail, Last.Head, Last.Tail, First.GetRotation());

	Builder = CreateBuilder();

	RIGEX_LOG_VERBOSE(Generator, "%s: %d orgs, average length %.4f, %d segments", *BaseBone.ToString(), Orgs.Num(), AverageLength, Details.BBoneSegments);
	return true;
}

bool FRigExChainRig::InitializeDetails(FRigExSkinContext& InContext, const FRigExBone& InMetaBone)
{
	const FRigExParamReader Reader(InMetaBone, InContext.GetReport(), GetRigType());
	Details.Read(Reader);
	return Details.Validate(Reader) && Reader.IsValid();
}

TSharedPtr<FRigExChainBuilder> FRigExChainRig::CreateBuilder()
{
	return MakeShared<FRigExChainBuilder>(this);
}

FQuat FRigExChainRig::GetControlNodeRotation(const FRigExSkinContext& InContext) const
{
	return ChainRotation;
}

FRigExNodeEntry FRigExChainRig::MakeChainEntry(const FRigExSkinContext& InContext, const int32 InIndex)
{
	const int32 NumOrgs = Orgs.Num();
	const bool bIsEnd = InIndex == NumOrgs;

	const FName Org = Orgs[bIsEnd ? NumOrgs - 1 : InIndex];
	const FRigExBone& OrgBone = InContext.GetBone(Org);

	FRigExNodeEntry Entry = MakeEntry(
		InContext, Org,
		RigExNaming::MakeDerivedName(Org, ERigExBoneRole::Control, bIsEnd ? TEXT("_end") : TEXT("")),
		bIsEnd ? OrgBone.Tail : OrgBone.Head, InIndex);

	Entry.Size = AverageLength / 3;
	Entry.Priority = Details.Priority;
	Entry.bConnectMirror = Details.bConnectMirror;
	Entry.bConnectEnds = Details.bConnectEnds;

	return Entry;
}

void FRigExChainRig::CollectNodes(FRigExSkinContext& InContext)
{
	FRigExNodeRegistry& Registry = InContext.GetRegistry();

	Nodes.Reset();
	for (int32 i = 0; i <= Orgs.Num(); i++) { Nodes.Add(Registry.Register(MakeChainEntry(InContext, i))); }

	Registry.SetChainEndNeighbor(Nodes[0], Nodes[1]);
	Registry.SetChainEndNeighbor(Nodes.Last(), Nodes[Nodes.Num() - 2]);
}

bool FRigExChainRig::ValidateNodes(FRigExSkinContext& InContext)
{
	TSet<int32> Distinct;
	for (const FRigExNodeHandle& Handle : Nodes) { Distinct.Add(InContext.GetNode(Handle).GetIndex()); }

	if (Distinct.Num() < 2)
	{
		InContext.AddError(MetaBone, Kind, FString::Printf(TEXT("Chain merges into %d control node, at least 2 are required"), Distinct.Num()));
		return false;
	}

	for (int32 i = 1; i < Nodes.Num(); i++)
	{
		if (InContext.GetNode(Nodes[i - 1]).GetIndex() == InContext.GetNode(Nodes[i]).GetIndex())
		{
			InContext.AddWarning(MetaBone, Kind, FString::Printf(TEXT("Bone %s collapses into a single control node"), *Orgs[i - 1].ToString()));
		}
	}

	return true;
}

void FRigExChainRig::GenerateBones(FRigExSkinContext& InContext)
{
	Builder->GenerateBones(InContext);
}

void FRigExChainRig::ParentBones(FRigExSkinContext& InContext)
{
	Builder->ParentBones(InContext);
}

void FRigExChainRig::RigBones(FRigExSkinContext& InContext)
{
	Builder->RigBones(InContext);
}
