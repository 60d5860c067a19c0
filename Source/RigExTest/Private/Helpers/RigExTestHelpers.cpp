// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Helpers/RigExTestHelpers.h"

#include "Core/RigExSkinContext.h"
#include "Naming/RigExBoneNaming.h"
#include "Nodes/RigExNodeRegistry.h"
#include "Nodes/RigExOwnershipResolver.h"
#include "Parents/RigExNodeParents.h"
#include "Parents/RigExParentComposer.h"

namespace RigExTest
{
	FMetarigBuilder::FMetarigBuilder()
		: Armature(MakeShared<FRigExArmature>())
	{
	}

	FMetarigBuilder& FMetarigBuilder::Bone(const FName InName, const FVector& InHead, const FVector& InTail, const FName InParent, const bool bConnected)
	{
		Armature->AddBone(InName, InHead, InTail);
		if (!InParent.IsNone()) { Armature->SetParent(InName, InParent, ERigExInheritScale::Full, bConnected); }
		return *this;
	}

	FName FMetarigBuilder::ChainBoneName(const FString& InBase, const FString& InSuffix, const int32 InIndex)
	{
		FString Name = FString::Printf(TEXT("%s.%03d"), *InBase, InIndex + 1);
		if (!InSuffix.IsEmpty()) { Name += TEXT(".") + InSuffix; }
		return FName(Name);
	}

	FMetarigBuilder& FMetarigBuilder::Chain(const FString& InBase, const FString& InSuffix, const TArray<FVector>& InPoints, const FName InParent)
	{
		FName Previous = InParent;
		for (int32 i = 0; i + 1 < InPoints.Num(); i++)
		{
			const FName Name = ChainBoneName(InBase, InSuffix, i);
			Bone(Name, InPoints[i], InPoints[i + 1], Previous, i > 0);
			Previous = Name;
		}
		return *this;
	}

	FMetarigBuilder& FMetarigBuilder::Tag(const FName InBone, const FName InRigType)
	{
		Armature->GetChecked(InBone).RigType = InRigType;
		return *this;
	}

	FMetarigBuilder& FMetarigBuilder::Param(const FName InBone, const FName InKey, const FString& InValue)
	{
		Armature->GetChecked(InBone).Params.Add(InKey, InValue);
		return *this;
	}

	FRigExNodeEntry MakeEntry(const FName InChainName, const FName InName, const int32 InIndex, const FVector& InPoint, const ERigExSkinRigKind InKind, const FName InParentBone)
	{
		FRigExNodeEntry Entry;
		Entry.Kind = InKind;
		Entry.ChainName = InChainName;
		Entry.Name = InName;
		Entry.Org = RigExNaming::MakeOrgName(InName);
		Entry.IndexInChain = InIndex;
		Entry.Point = InPoint;
		Entry.ParentBone = InParentBone;
		Entry.MergeDomain = FName("SkinControls");
		Entry.bCanMerge = InKind != ERigExSkinRigKind::Anchor;
		return Entry;
	}

	FNodeFixture::FNodeFixture(const double InTolerance)
		: Armature(MakeShared<FRigExArmature>()),
		  Report(MakeShared<FRigExBuildReport>()),
		  Context(MakeShared<FRigExSkinContext>(Armature, *Report))
	{
		Context->Registry = MakeShared<FRigExNodeRegistry>(InTolerance);
		Context->Stage = ERigExSkinStage::Collect;
	}

	FRigExNodeRegistry& FNodeFixture::GetRegistry() const
	{
		return Context->GetRegistry();
	}

	FRigExNodeHandle FNodeFixture::Register(FRigExNodeEntry InEntry)
	{
		if (!Armature->Contains(InEntry.Org)) { Armature->AddBone(InEntry.Org, InEntry.Point, InEntry.Point + FVector(0, 1, 0)); }
		if (!InEntry.ParentBone.IsNone() && !Armature->Contains(InEntry.ParentBone)) { Armature->AddBone(InEntry.ParentBone, FVector::ZeroVector, FVector(0, 1, 0)); }
		return GetRegistry().Register(InEntry);
	}

	bool FNodeFixture::Freeze() const
	{
		return GetRegistry().Freeze(*Report);
	}

	void FNodeFixture::Resolve() const
	{
		Context->Stage = ERigExSkinStage::Resolve;
		Context->Resolver = MakeShared<FRigExOwnershipResolver>(Context->Registry.ToSharedRef());
		Context->Resolver->ResolveAll();
	}

	void FNodeFixture::Compose() const
	{
		Context->Stage = ERigExSkinStage::Compose;
		Context->Composer = MakeShared<FRigExParentComposer>(Context);
		Context->Composer->ComposeAll();
	}

	void FNodeFixture::BuildNodeBones() const
	{
		Context->Stage = ERigExSkinStage::Build;
		const TArray<TSharedPtr<FRigExControlNode>>& Nodes = GetRegistry().GetNodes();
		for (const TSharedPtr<FRigExControlNode>& Node : Nodes) { Context->Composer->GenerateBones(*Node); }
		for (const TSharedPtr<FRigExControlNode>& Node : Nodes) { Context->Composer->ParentBones(*Node); }
		for (const TSharedPtr<FRigExControlNode>& Node : Nodes) { Context->Composer->RigBones(*Node); }
	}

	FRigExControlNode& FNodeFixture::GetNode(const FRigExNodeHandle InHandle) const
	{
		return Context->GetNode(InHandle);
	}

	bool HasConstraint(const FRigExArmature& InArmature, const FName InBone, const ERigExConstraintKind InKind, const FName InTarget)
	{
		const FRigExBone* Bone = InArmature.Find(InBone);
		if (!Bone) { return false; }

		for (const FRigExConstraint& Con : Bone->Constraints)
		{
			if (Con.Kind != InKind) { continue; }
			if (InTarget.IsNone() || Con.GetTarget() == InTarget) { return true; }
		}
		return false;
	}
}
