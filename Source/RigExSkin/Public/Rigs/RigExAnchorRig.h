// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Details/RigExSkinDetails.h"
#include "Rigs/RigExSkinRig.h"

/**
 * Single custom control node. Never merges into other nodes, and always owns the
 * nodes that merge into it.
 */
class RIGEXSKIN_API FRigExAnchorRig final : public FRigExSkinNodeRig
{
	FRigExAnchorDetails Details;
	FRigExNodeHandle Node;
	FName DeformBone = NAME_None;

public:
	FRigExAnchorRig();

	const FRigExAnchorDetails& GetDetails() const { return Details; }
	FRigExNodeHandle GetNode() const { return Node; }
	FName GetDeformBone() const { return DeformBone; }

	virtual bool Initialize(FRigExSkinContext& InContext, const FRigExBone& InMetaBone) override;
	virtual void CollectNodes(FRigExSkinContext& InContext) override;

	virtual void GenerateBones(FRigExSkinContext& InContext) override;
	virtual void ParentBones(FRigExSkinContext& InContext) override;
};
