// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Details/RigExSkinDetails.h"
#include "Rigs/RigExSkinRig.h"

class FRigExChainBuilder;

/**
 * Skin chain with independent control nodes at every bone head plus the last tail.
 * Org bones stretch between consecutive controls; with B-Bones the deform chain
 * interpolates through handle mechanisms.
 */
class RIGEXSKIN_API FRigExChainRig : public FRigExSkinNodeRig
{
protected:
	FRigExChainDetails Details;

	double AverageLength = 1;
	FQuat ChainRotation = FQuat::Identity;

	/** Entries of the chain nodes; the last one is the tail of the last bone */
	TArray<FRigExNodeHandle> Nodes;

	TSharedPtr<FRigExChainBuilder> Builder;

	explicit FRigExChainRig(const ERigExSkinRigKind InKind);

public:
	FRigExChainRig();

	const FRigExChainDetails& GetDetails() const { return Details; }
	const TArray<FRigExNodeHandle>& GetNodes() const { return Nodes; }
	int32 GetNumOrgs() const { return Orgs.Num(); }
	double GetAverageLength() const { return AverageLength; }
	const TSharedPtr<FRigExChainBuilder>& GetBuilder() const { return Builder; }

	virtual bool Initialize(FRigExSkinContext& InContext, const FRigExBone& InMetaBone) override;
	virtual void CollectNodes(FRigExSkinContext& InContext) override;
	virtual bool ValidateNodes(FRigExSkinContext& InContext) override;

	virtual FQuat GetControlNodeRotation(const FRigExSkinContext& InContext) const override;

	virtual void GenerateBones(FRigExSkinContext& InContext) override;
	virtual void ParentBones(FRigExSkinContext& InContext) override;
	virtual void RigBones(FRigExSkinContext& InContext) override;

protected:
	virtual bool InitializeDetails(FRigExSkinContext& InContext, const FRigExBone& InMetaBone);
	virtual TSharedPtr<FRigExChainBuilder> CreateBuilder();
	virtual FRigExNodeEntry MakeChainEntry(const FRigExSkinContext& InContext, const int32 InIndex);
};
