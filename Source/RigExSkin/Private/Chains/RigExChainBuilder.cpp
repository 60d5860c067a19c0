// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Chains/RigExChainBuilder.h"

#include "RigExCoreSettingsCache.h"
#include "RigExSkinSettingsCache.h"
#include "Core/RigExLog.h"
#include "Core/RigExSkinContext.h"
#include "Math/RigExMath.h"
#include "Naming/RigExBoneNaming.h"
#include "Nodes/RigExNodeRegistry.h"
#include "Nodes/RigExOwnershipResolver.h"
#include "Rigs/RigExChainRig.h"
#include "Rigs/RigExStretchyChainRig.h"

#pragma region FRigExChainBuilder

FRigExChainBuilder::FRigExChainBuilder(FRigExChainRig* InRig)
	: Rig(InRig)
{
	check(Rig);
}

bool FRigExChainBuilder::UsesBBones() const
{
	return Rig->GetDetails().UsesBBones();
}

FName FRigExChainBuilder::GetHandleBone(const int32 InIndex) const
{
	if (Handles.IsValidIndex(InIndex)) { return Handles[InIndex]; }
	if (NextChain && InIndex == Handles.Num()) { return NextChain->GetHandleBone(0); }
	return NAME_None;
}

TArray<FName> FRigExChainBuilder::GetAllHandles() const
{
	TArray<FName> Result = Handles;
	if (NextChain) { Result.Add(NextChain->GetHandleBone(0)); }
	return Result;
}

FName FRigExChainBuilder::GetControlOf(const FRigExSkinContext& InContext, const int32 InEntry) const
{
	return InContext.GetNodeOfEntry(InEntry).ControlBone;
}

const FVector& FRigExChainBuilder::GetPointOf(const FRigExSkinContext& InContext, const int32 InEntry) const
{
	return InContext.GetNodeOfEntry(InEntry).GetPoint();
}

bool FRigExChainBuilder::GetConnectedNode(const FRigExSkinContext& InContext, const int32 InEntry, int32& OutLink, int32& OutNeighbor) const
{
	OutLink = INDEX_NONE;
	OutNeighbor = INDEX_NONE;

	const FRigExChainDetails& Details = Rig->GetDetails();

	if (Details.bConnectMirror)
	{
		const int32 Mirror = InContext.GetResolver().FindBestMirror(InEntry);
		if (Mirror != INDEX_NONE)
		{
			const FRigExNodeEntry& MirrorEntry = InContext.GetEntry(Mirror);
			if (MirrorEntry.IsChainEnd() && RigExSkin::IsChainKind(MirrorEntry.Kind) && MirrorEntry.bConnectMirror)
			{
				OutLink = Mirror;
				OutNeighbor = MirrorEntry.ChainEndNeighbor;
				return true;
			}
		}
	}

	if (Details.bConnectEnds)
	{
		TArray<int32> Starts;
		TArray<int32> Ends;

		for (const int32 Sibling : InContext.GetNodeOfEntry(InEntry).GetEntries())
		{
			const FRigExNodeEntry& SiblingEntry = InContext.GetEntry(Sibling);
			if (!RigExSkin::IsChainKind(SiblingEntry.Kind) || !SiblingEntry.IsChainEnd() || !SiblingEntry.bConnectEnds) { continue; }

			if (SiblingEntry.IndexInChain == 0) { Starts.Add(Sibling); }
			else { Ends.Add(Sibling); }
		}

		if (Starts.Num() == 1 && Ends.Num() == 1 && (Starts[0] == InEntry || Ends[0] == InEntry))
		{
			OutLink = Starts[0] == InEntry ? Ends[0] : Starts[0];
			OutNeighbor = InContext.GetEntry(OutLink).ChainEndNeighbor;
			return true;
		}
	}

	return false;
}

void FRigExChainBuilder::ResolveConnections(const FRigExSkinContext& InContext)
{
	check(!bConnected);
	bConnected = true;

	const TArray<FRigExNodeHandle>& Nodes = Rig->GetNodes();

	GetConnectedNode(InContext, Nodes[0].Entry, PrevLink, PrevEntry);
	GetConnectedNode(InContext, Nodes.Last().Entry, NextLink, NextEntry);

	// Sharing the first handle of the next chain keeps a single tangent across the joint
	NextChain = nullptr;
	if (NextLink != INDEX_NONE)
	{
		const FRigExNodeEntry& Link = InContext.GetEntry(NextLink);
		if (Link.IndexInChain == 0 && Link.Rig && RigExSkin::IsChainKind(Link.Rig->GetKind()))
		{
			const TSharedPtr<FRigExChainBuilder>& Other = static_cast<const FRigExChainRig*>(Link.Rig)->GetBuilder();
			if (Other && Other.Get() != this && Other->UsesBBones()) { NextChain = Other.Get(); }
		}
	}

	RIGEX_LOG_VERBOSE(
		Chain, "%s: prev %s, next %s%s", *Rig->GetBaseBone().ToString(),
		PrevEntry != INDEX_NONE ? *InContext.GetEntry(PrevEntry).Name.ToString() : TEXT("-"),
		NextEntry != INDEX_NONE ? *InContext.GetEntry(NextEntry).Name.ToString() : TEXT("-"),
		NextChain ? TEXT(" (shared handle)") : TEXT(""));
}

FName FRigExChainBuilder::MakeHandleBone(const FRigExSkinContext& InContext, const int32 InPrev, const int32 InNode, const int32 InNext)
{
	const FRigExNodeEntry& Entry = InContext.GetEntry(InNode);

	const int32 HandleStart = InPrev != INDEX_NONE ? InPrev : InNode;
	const int32 HandleEnd = InNext != INDEX_NONE ? InNext : InNode;

	FVector Axis = GetPointOf(InContext, HandleEnd) - GetPointOf(InContext, HandleStart);

	const FRigExBone& Org = InContext.GetBone(Entry.Org);
	FVector OrgDirection = Org.GetDirection();
	const FQuat OrgRotation = Org.GetRotation();

	if (RIGEX_CORE_SETTINGS.IsDegenerate(OrgDirection.Size())) { OrgDirection = RigExMath::BoneAxis; }

	if (RIGEX_CORE_SETTINGS.IsDegenerate(Axis.Size()))
	{
		InContext.AddWarning(Entry.Name, Rig->GetKind(), TEXT("Degenerate handle axis, falling back to the bone direction"));
		Axis = OrgDirection;
	}

	Axis.Normalize();

	const FName Name = InContext.CopyBone(Entry.Org, RigExNaming::MakeDerivedName(Entry.Name, ERigExBoneRole::Mechanism, TEXT("_handle")));

	// Keep the org roll, turned onto the handle axis
	const FQuat Rotation = FQuat::FindBetweenNormals(OrgDirection, Axis) * OrgRotation;
	InContext.GetBone(Name).SetPlacement(GetPointOf(InContext, InNode), Rotation, Rig->GetAverageLength() * RIGEX_SKIN_SETTINGS.HandleLengthFactor);

	return Name;
}

void FRigExChainBuilder::GenerateBones(const FRigExSkinContext& InContext)
{
	const TArray<FRigExNodeHandle>& Nodes = Rig->GetNodes();
	const TArray<FName>& Orgs = Rig->GetOrgs();

	if (UsesBBones())
	{
		ResolveConnections(InContext);

		const int32 NumHandles = NextChain ? Nodes.Num() - 1 : Nodes.Num();
		for (int32 i = 0; i < NumHandles; i++)
		{
			const int32 Prev = i == 0 ? PrevEntry : Nodes[i - 1].Entry;
			const int32 Next = i + 1 < Nodes.Num() ? Nodes[i + 1].Entry : NextEntry;
			Handles.Add(MakeHandleBone(InContext, Prev, Nodes[i].Entry, Next));
		}
	}

	for (const FName Org : Orgs)
	{
		const FName Deform = InContext.CopyBone(Org, RigExNaming::MakeDerivedName(Org, ERigExBoneRole::Deform), true);

		FRigExBone& Bone = InContext.GetBone(Deform);
		Bone.BBoneSegments = Rig->GetDetails().BBoneSegments;
		Bone.bDeform = true;

		Deforms.Add(Deform);
	}
}

void FRigExChainBuilder::ParentBones(const FRigExSkinContext& InContext)
{
	const TArray<FName>& Orgs = Rig->GetOrgs();
	const FName RigParent = Rig->GetRigParentBone();

	for (int32 i = 0; i < Orgs.Num(); i++)
	{
		if (i == 0) { InContext.SetParent(Orgs[i], RigParent, ERigExInheritScale::Average); }
		else { InContext.SetParent(Orgs[i], Orgs[i - 1], ERigExInheritScale::Average, true); }
	}

	for (int32 i = 0; i < Deforms.Num(); i++)
	{
		if (i == 0) { InContext.SetParent(Deforms[i], RigParent, ERigExInheritScale::Average); }
		else { InContext.SetParent(Deforms[i], Deforms[i - 1], ERigExInheritScale::Average, true); }
	}

	if (!UsesBBones()) { return; }

	for (const FName Handle : Handles) { InContext.SetParent(Handle, RigParent, ERigExInheritScale::Average); }

	const TArray<FName> AllHandles = GetAllHandles();
	check(AllHandles.Num() == Deforms.Num() + 1);

	for (int32 i = 0; i < Deforms.Num(); i++)
	{
		FRigExBone& Bone = InContext.GetBone(Deforms[i]);
		Bone.HandleStartType = ERigExBBoneHandle::Tangent;
		Bone.HandleStart = AllHandles[i];
		Bone.HandleEndType = ERigExBBoneHandle::Tangent;
		Bone.HandleEnd = AllHandles[i + 1];
	}

	ComputeEases(InContext);
	InContext.GetBone(Deforms[0]).EaseIn = StartEase;
	InContext.GetBone(Deforms.Last()).EaseOut = EndEase;
}

void FRigExChainBuilder::RigBones(const FRigExSkinContext& InContext)
{
	const TArray<FRigExNodeHandle>& Nodes = Rig->GetNodes();
	const TArray<FName>& Orgs = Rig->GetOrgs();

	if (UsesBBones())
	{
		for (int32 i = 0; i < Handles.Num(); i++)
		{
			const int32 Prev = i == 0 ? PrevEntry : Nodes[i - 1].Entry;
			const int32 Next = i + 1 < Nodes.Num() ? Nodes[i + 1].Entry : NextEntry;
			RigHandleAuto(InContext, Handles[i], Prev, Nodes[i].Entry, Next);
		}

		for (int32 i = 0; i < Handles.Num(); i++) { RigHandleUser(InContext, i, Handles[i], Nodes[i].Entry); }
	}

	for (int32 i = 0; i < Orgs.Num(); i++)
	{
		if (i == 0) { InContext.MakeConstraint(Orgs[i], ERigExConstraintKind::CopyLocation, FName("locate_start"), GetControlOf(InContext, Nodes[0].Entry)); }

		FRigExConstraint& Stretch = InContext.MakeConstraint(Orgs[i], ERigExConstraintKind::StretchTo, FName("stretch"), GetControlOf(InContext, Nodes[i + 1].Entry));
		Stretch.bKeepSwingY = true;
	}

	for (int32 i = 0; i < Deforms.Num(); i++)
	{
		InContext.MakeConstraint(Deforms[i], ERigExConstraintKind::CopyTransforms, FName("copy_org"), Orgs[i]);
	}
}

void FRigExChainBuilder::RigHandleAuto(const FRigExSkinContext& InContext, const FName InHandle, const int32 InPrev, const int32 InNode, const int32 InNext) const
{
	const int32 HandleStart = InPrev != INDEX_NONE ? InPrev : InNode;
	const int32 HandleEnd = InNext != INDEX_NONE ? InNext : InNode;

	// Emulate automatic handles
	InContext.MakeConstraint(InHandle, ERigExConstraintKind::CopyLocation, FName("locate_prev"), GetControlOf(InContext, HandleStart));
	InContext.MakeConstraint(InHandle, ERigExConstraintKind::DampedTrack, FName("track_next"), GetControlOf(InContext, HandleEnd));
}

void FRigExChainBuilder::RigHandleUser(const FRigExSkinContext& InContext, const int32 InIndex, const FName InHandle, const int32 InNode) const
{
	// User rotation and scale
	FRigExConstraint& Copy = InContext.MakeConstraint(InHandle, ERigExConstraintKind::CopyTransforms, FName("copy_user"), GetControlOf(InContext, InNode));
	Copy.OwnerSpace = ERigExSpace::Local;
	Copy.TargetSpace = ERigExSpace::OwnerLocal;
	Copy.MixMode = ERigExMixMode::BeforeFull;

	// Drop the shear introduced by the copy
	InContext.MakeConstraint(InHandle, ERigExConstraintKind::LimitRotation, FName("remove_shear"));
}

void FRigExChainBuilder::ComputeEases(const FRigExSkinContext& InContext)
{
	StartEase = 1;
	EndEase = 1;

	const double Threshold = Rig->GetDetails().SharpenThreshold;
	if (Threshold <= 0) { return; }

	const TArray<FRigExNodeHandle>& Nodes = Rig->GetNodes();

	if (PrevEntry != INDEX_NONE)
	{
		const double Angle = RigExMath::GetJointAngle(GetPointOf(InContext, PrevEntry), GetPointOf(InContext, Nodes[0].Entry), GetPointOf(InContext, Nodes[1].Entry));
		StartEase = ComputeCornerEase(Angle, Threshold);
	}

	if (NextEntry != INDEX_NONE)
	{
		const int32 Last = Nodes.Num() - 1;
		const double Angle = RigExMath::GetJointAngle(GetPointOf(InContext, Nodes[Last - 1].Entry), GetPointOf(InContext, Nodes[Last].Entry), GetPointOf(InContext, NextEntry));
		EndEase = ComputeCornerEase(Angle, Threshold);
	}

	RIGEX_LOG_VERBOSE(Chain, "%s: corner ease start %.3f, end %.3f", *Rig->GetBaseBone().ToString(), StartEase, EndEase);
}

double FRigExChainBuilder::ComputeCornerEase(const double InAngle, const double InThreshold)
{
	if (InThreshold <= 0 || InAngle >= InThreshold) { return 1; }
	return FMath::Max(InAngle, 0.0) / InThreshold;
}

#pragma endregion

#pragma region FRigExStretchyChainBuilder

FRigExStretchyChainBuilder::FRigExStretchyChainBuilder(FRigExStretchyChainRig* InRig)
	: FRigExChainBuilder(InRig), StretchyRig(InRig)
{
}

void FRigExStretchyChainBuilder::GetPropagateSpec(const int32 InIndex, int32& OutIndex1, int32& OutIndex2, double& OutFactor) const
{
	const TArray<double>& Lengths = StretchyRig->GetProjection().ChainLengths;
	const int32 NumOrgs = StretchyRig->GetNumOrgs();
	const int32 Pivot = StretchyRig->GetStretchyDetails().PivotPos;

	OutIndex1 = 0;
	OutIndex2 = NumOrgs;

	const double Current = Lengths[InIndex];
	const double End = Lengths[NumOrgs];

	if (Pivot > 0)
	{
		const double PivotLength = Lengths[Pivot];
		if (InIndex < Pivot)
		{
			OutFactor = PivotLength > SMALL_NUMBER ? Current / PivotLength : 0;
			OutIndex2 = Pivot;
		}
		else
		{
			OutFactor = End - PivotLength > SMALL_NUMBER ? (Current - PivotLength) / (End - PivotLength) : 0;
			OutIndex1 = Pivot;
		}
	}
	else
	{
		OutFactor = End > SMALL_NUMBER ? Current / End : 0;
	}

	OutFactor = FMath::Clamp(OutFactor, 0.0, 1.0);
}

void FRigExStretchyChainBuilder::RigPropagate(const FRigExSkinContext& InContext, const FName InBone, const int32 InIndex) const
{
	if (StretchyRig->IsDriverIndex(InIndex)) { return; }

	const FRigExStretchyDetails& Details = StretchyRig->GetStretchyDetails();

	int32 Index1 = 0;
	int32 Index2 = 0;
	double Factor = 0;
	GetPropagateSpec(InIndex, Index1, Index2, Factor);

	const TArray<FName> AllHandles = GetAllHandles();

	if (Details.bPropagateTwist)
	{
		FRigExBone& Bone = InContext.GetBone(InBone);
		Bone.RotationMode = ERigExRotationMode::YXZ;

		FRigExDriver& Driver = Bone.Drivers.AddDefaulted_GetRef();
		Driver.Property = FName("rotation_euler");
		Driver.Index = 1;
		Driver.Expression = FString::Printf(TEXT("lerp(y1,y2,%.6f)"), Factor);

		const FName Sources[2] = {AllHandles[Index1], AllHandles[Index2]};
		const FName VarNames[2] = {FName("y1"), FName("y2")};

		for (int32 i = 0; i < 2; i++)
		{
			FRigExDriverVariable& Var = Driver.Variables.AddDefaulted_GetRef();
			Var.Name = VarNames[i];
			Var.Bone = Sources[i];
			Var.Channel = ERigExTransformChannel::RotY;
			Var.Space = ERigExSpace::Local;
			Var.bSwingTwistY = true;
		}
	}

	if (Details.bPropagateScale)
	{
		const FName Names[2] = {FName("propagate_scale_start"), FName("propagate_scale_end")};
		const FName Sources[2] = {AllHandles[Index1], AllHandles[Index2]};
		const double Powers[2] = {1 - Factor, Factor};

		for (int32 i = 0; i < 2; i++)
		{
			FRigExConstraint& Scale = InContext.MakeConstraint(InBone, ERigExConstraintKind::CopyScale, Names[i], Sources[i]);
			Scale.SetSpace(ERigExSpace::Local);
			Scale.bUseX = true;
			Scale.bUseY = false;
			Scale.bUseZ = true;
			Scale.bUseOffset = true;
			Scale.Power = Powers[i];
		}
	}
}

void FRigExStretchyChainBuilder::RigHandleUser(const FRigExSkinContext& InContext, const int32 InIndex, const FName InHandle, const int32 InNode) const
{
	FRigExChainBuilder::RigHandleUser(InContext, InIndex, InHandle, InNode);
	RigPropagate(InContext, InHandle, InIndex);
}

#pragma endregion
