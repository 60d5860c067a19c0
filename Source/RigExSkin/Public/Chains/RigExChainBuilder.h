// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

class FRigExSkinContext;
class FRigExChainRig;
class FRigExStretchyChainRig;

/**
 * Builds the bridging mechanism of one chain from its resolved nodes.
 *
 * One segment: org bones stretch from control to control.
 * More: a handle bone per node drives the B-Bone tangents of the deform chain; chain ends
 * connected to a mirror or a matching chain take their handle axis across the joint.
 */
class RIGEXSKIN_API FRigExChainBuilder : public TSharedFromThis<FRigExChainBuilder>
{
protected:
	FRigExChainRig* Rig = nullptr;

	/** Entries linked across the chain ends, INDEX_NONE if unconnected */
	int32 PrevLink = INDEX_NONE;
	int32 PrevEntry = INDEX_NONE;
	int32 NextLink = INDEX_NONE;
	int32 NextEntry = INDEX_NONE;

	/** Chain whose first handle is shared as our last one */
	const FRigExChainBuilder* NextChain = nullptr;

	TArray<FName> Handles;
	TArray<FName> Deforms;

	double StartEase = 1;
	double EndEase = 1;

	bool bConnected = false;

public:
	explicit FRigExChainBuilder(FRigExChainRig* InRig);
	virtual ~FRigExChainBuilder() = default;

	bool UsesBBones() const;

	/** Own handles, one per node; one less when the last is shared with the next chain */
	const TArray<FName>& GetHandles() const { return Handles; }
	FName GetHandleBone(const int32 InIndex) const;
	TArray<FName> GetAllHandles() const;

	const TArray<FName>& GetDeformBones() const { return Deforms; }

	int32 GetPrevEntry() const { return PrevEntry; }
	int32 GetNextEntry() const { return NextEntry; }
	const FRigExChainBuilder* GetNextChain() const { return NextChain; }

	double GetStartEase() const { return StartEase; }
	double GetEndEase() const { return EndEase; }

	/**
	 * Entry connected to InEntry across a chain end and that entry's chain neighbor.
	 * Mirror connection needs both chains flagged; matching ends needs exactly one start and one end.
	 */
	bool GetConnectedNode(const FRigExSkinContext& InContext, const int32 InEntry, int32& OutLink, int32& OutNeighbor) const;

	/** Find the chain end connections; needs resolved and composed nodes */
	void ResolveConnections(const FRigExSkinContext& InContext);

	virtual void GenerateBones(const FRigExSkinContext& InContext);
	virtual void ParentBones(const FRigExSkinContext& InContext);
	virtual void RigBones(const FRigExSkinContext& InContext);

	/**
	 * Ease at a joint with the given interior angle, 180 being straight.
	 * 1 at or above the threshold, proportionally less below it; a threshold of 0 disables.
	 */
	static double ComputeCornerEase(const double InAngle, const double InThreshold);

protected:
	FName MakeHandleBone(const FRigExSkinContext& InContext, const int32 InPrev, const int32 InNode, const int32 InNext);

	void RigHandleAuto(const FRigExSkinContext& InContext, const FName InHandle, const int32 InPrev, const int32 InNode, const int32 InNext) const;
	virtual void RigHandleUser(const FRigExSkinContext& InContext, const int32 InIndex, const FName InHandle, const int32 InNode) const;

	void ComputeEases(const FRigExSkinContext& InContext);

	FName GetControlOf(const FRigExSkinContext& InContext, const int32 InEntry) const;
	const FVector& GetPointOf(const FRigExSkinContext& InContext, const int32 InEntry) const;
};

/**
 * Adds twist and scale propagation from the driver handles to the handles in between.
 */
class RIGEXSKIN_API FRigExStretchyChainBuilder final : public FRigExChainBuilder
{
	FRigExStretchyChainRig* StretchyRig = nullptr;

public:
	explicit FRigExStretchyChainBuilder(FRigExStretchyChainRig* InRig);

	/** Driver handles bracketing a node and the node's factor between them */
	void GetPropagateSpec(const int32 InIndex, int32& OutIndex1, int32& OutIndex2, double& OutFactor) const;

	/** Twist driver and scale constraints on InBone interpolating between the bracketing handles */
	void RigPropagate(const FRigExSkinContext& InContext, const FName InBone, const int32 InIndex) const;

protected:
	virtual void RigHandleUser(const FRigExSkinContext& InContext, const int32 InIndex, const FName InHandle, const int32 InNode) const override;
};
