// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Core/RigExSkinCommon.h"
#include "Nodes/RigExControlNode.h"

struct FRigExBone;
class FRigExArmature;
class FRigExSkinContext;
class FRigExNodeParent;

/**
 * Base of every skin generator instantiated from a tagged metarig bone.
 *
 * Lifecycle, driven by FRigExSkinGenerator:
 *  Initialize    read parameters, find org bones
 *  CollectNodes  register control points and queries
 *  ValidateNodes check the merged result
 *  GenerateBones / ParentBones / RigBones
 */
class RIGEXSKIN_API FRigExSkinRig : public TSharedFromThis<FRigExSkinRig>
{
protected:
	ERigExSkinRigKind Kind = ERigExSkinRigKind::Anchor;

	/** Tagged metarig bone, as authored */
	FName MetaBone = NAME_None;

	/** Same bone in the generated rig */
	FName BaseBone = NAME_None;

	/** Parent of the base bone in the generated rig */
	FName RigParentBone = NAME_None;

	/** Closest skin generator above this one */
	FRigExSkinRig* ParentRig = nullptr;

	TArray<FName> Orgs;

	int32 RotationIndex = 0;
	bool bMergeParentRotationAndScale = false;

public:
	explicit FRigExSkinRig(const ERigExSkinRigKind InKind);
	virtual ~FRigExSkinRig() = default;

	ERigExSkinRigKind GetKind() const { return Kind; }
	FName GetRigType() const { return RigExSkin::GetRigType(Kind); }
	FName GetMetaBone() const { return MetaBone; }
	FName GetBaseBone() const { return BaseBone; }
	FName GetRigParentBone() const { return RigParentBone; }
	FRigExSkinRig* GetParentRig() const { return ParentRig; }
	const TArray<FName>& GetOrgs() const { return Orgs; }

	void Bind(const FName InMetaBone, const FName InBaseBone, FRigExSkinRig* InParentRig, const FRigExArmature& InRig);

	/** This rig followed by every skin generator above it */
	TArray<FRigExSkinRig*> GetParentSkinRigs();
	int32 GetParentDepth() const;

	virtual bool Initialize(FRigExSkinContext& InContext, const FRigExBone& InMetaBone) = 0;

	virtual void CollectNodes(FRigExSkinContext& InContext)
	{
	}

	virtual bool ValidateNodes(FRigExSkinContext& InContext) { return true; }

	/** Innermost parent mechanism for a node entry of this rig or of a rig below it */
	virtual TSharedPtr<FRigExNodeParent> BuildNodeParent(const FRigExNodeEntry& InEntry);

	/** Layer additional parent motion over InParent; called for every skin rig above the entry's own, outermost first */
	virtual TSharedPtr<FRigExNodeParent> ExtendNodeParent(const FRigExSkinContext& InContext, const TSharedPtr<FRigExNodeParent>& InParent, const FRigExControlNode& InNode, const FRigExNodeEntry& InEntry, const bool bMergeParentRotationAndScale);

	/** Orientation this rig gives to the controls it provides orientation for */
	virtual FQuat GetControlNodeRotation(const FRigExSkinContext& InContext) const;

	/** Orientation from the rig selected by the rotation index */
	FQuat GetFinalControlNodeRotation(const FRigExSkinContext& InContext) const;

	virtual void GenerateBones(FRigExSkinContext& InContext)
	{
	}

	virtual void ParentBones(FRigExSkinContext& InContext)
	{
	}

	virtual void RigBones(FRigExSkinContext& InContext)
	{
	}

protected:
	/** Entry with the fields every generator fills the same way */
	FRigExNodeEntry MakeEntry(const FRigExSkinContext& InContext, const FName InOrg, const FName InName, const FVector& InPoint, const int32 InIndex);
};

/** Generators that own control nodes; their nodes follow the parent rig or the base bone parent */
class RIGEXSKIN_API FRigExSkinNodeRig : public FRigExSkinRig
{
public:
	explicit FRigExSkinNodeRig(const ERigExSkinRigKind InKind);

	virtual TSharedPtr<FRigExNodeParent> BuildNodeParent(const FRigExNodeEntry& InEntry) override;
};

namespace RigExSkin
{
	RIGEXSKIN_API TSharedPtr<FRigExSkinRig> CreateRig(const ERigExSkinRigKind InKind);
}
