// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Details/RigExSkinDetails.h"
#include "Rigs/RigExSkinRig.h"

/**
 * Attaches an existing bone and its constraints to whatever control sits at its head,
 * optionally relinking constraint targets to the control at its tail.
 */
class RIGEXSKIN_API FRigExGlueRig final : public FRigExSkinRig
{
	FRigExGlueDetails Details;

	FRigExQueryHandle HeadPosition;
	FRigExQueryHandle HeadConstraint;
	FRigExQueryHandle TailPosition;

public:
	FRigExGlueRig();

	const FRigExGlueDetails& GetDetails() const { return Details; }
	FRigExQueryHandle GetHeadQuery() const { return HeadPosition; }
	FRigExQueryHandle GetTailQuery() const { return TailPosition; }

	/** Bone the tail target resolves to */
	FName GetTailOutputBone(const FRigExSkinContext& InContext) const;

	virtual bool Initialize(FRigExSkinContext& InContext, const FRigExBone& InMetaBone) override;
	virtual void CollectNodes(FRigExSkinContext& InContext) override;

	virtual void GenerateBones(FRigExSkinContext& InContext) override;
	virtual void ParentBones(FRigExSkinContext& InContext) override;
	virtual void RigBones(FRigExSkinContext& InContext) override;
};
