// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Math/RigExFalloff.h"
#include "Rigs/RigExChainRig.h"

/**
 * Skin chain propagating the motion of its start, middle and end controls to the
 * controls in between, weighted by falloff curves, so the whole chain stretches.
 */
class RIGEXSKIN_API FRigExStretchyChainRig final : public FRigExChainRig
{
	FRigExStretchyDetails StretchyDetails;

	FRigExFalloffEvaluator Evaluator;
	FRigExChainProjection Projection;
	double PivotFactor = 0;

public:
	FRigExStretchyChainRig();

	const FRigExStretchyDetails& GetStretchyDetails() const { return StretchyDetails; }
	const FRigExFalloffEvaluator& GetEvaluator() const { return Evaluator; }
	const FRigExChainProjection& GetProjection() const { return Projection; }

	/** Node is one of the falloff drivers: start, end or middle pivot */
	bool IsDriverIndex(const int32 InIndex) const;

	virtual TSharedPtr<FRigExNodeParent> ExtendNodeParent(const FRigExSkinContext& InContext, const TSharedPtr<FRigExNodeParent>& InParent, const FRigExControlNode& InNode, const FRigExNodeEntry& InEntry, const bool bInMergeParentRotationAndScale) override;

protected:
	virtual bool InitializeDetails(FRigExSkinContext& InContext, const FRigExBone& InMetaBone) override;
	virtual TSharedPtr<FRigExChainBuilder> CreateBuilder() override;
	virtual FRigExNodeEntry MakeChainEntry(const FRigExSkinContext& InContext, const int32 InIndex) override;
};
