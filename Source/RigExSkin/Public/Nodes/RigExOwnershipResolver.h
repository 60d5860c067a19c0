// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Nodes/RigExControlNode.h"

class FRigExNodeRegistry;

/**
 * Total order key over node entries, compared field by field; lower wins ownership.
 */
struct RIGEXSKIN_API FRigExOwnershipRank
{
	/** Anchors first */
	bool bNotAnchor = true;

	/** Explicit priority, negated so higher priority sorts first */
	int32 NegPriority = 0;

	/** Closer to the root first */
	int32 ParentDepth = 0;

	/** Symmetry-tagged names first */
	bool bUntagged = true;

	FName ChainName = NAME_None;
	int32 IndexInChain = 0;
	FName Org = NAME_None;

	FRigExOwnershipRank() = default;
	explicit FRigExOwnershipRank(const FRigExNodeEntry& InEntry);

	bool operator<(const FRigExOwnershipRank& Other) const;
	bool operator==(const FRigExOwnershipRank& Other) const;

	FString ToString() const;
};

/**
 * Picks the owner of each merged node and its symmetry group.
 * Runs once every registration is in and the registry is frozen.
 */
class RIGEXSKIN_API FRigExOwnershipResolver : public TSharedFromThis<FRigExOwnershipResolver>
{
	TSharedRef<FRigExNodeRegistry> Registry;

public:
	explicit FRigExOwnershipResolver(const TSharedRef<FRigExNodeRegistry>& InRegistry);

	/** Sort the node entries best first, assign the owner and the symmetry group */
	void Resolve(FRigExControlNode& InNode) const;
	void ResolveAll() const;

	/** Entry of the same node whose name mirrors InEntry, trying both axes, then left/right, then top/bottom */
	int32 FindBestMirror(const int32 InEntry) const;

	/** Entry of InNode whose symmetry key matches, best ranked first; INDEX_NONE if none */
	int32 FindSibling(const FRigExControlNode& InNode, const FRigExSymmetryName& InName) const;

	bool RankLess(const int32 A, const int32 B) const;
};
