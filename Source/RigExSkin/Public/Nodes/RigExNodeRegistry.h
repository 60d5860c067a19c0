// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Nodes/RigExControlNode.h"

class FRigExBuildReport;

/**
 * Collects control point requests from every skin generator and merges the ones that coincide.
 *
 * Two phases:
 *  - Collection: Register / RegisterQuery / SetChainEndNeighbor.
 *  - Frozen: nodes are built and can be read; any further registration is fatal.
 *
 * Clustering does not depend on registration order: candidate pairs are found with a grid
 * hash and joined in the order of the entries' identity keys.
 */
class RIGEXSKIN_API FRigExNodeRegistry : public TSharedFromThis<FRigExNodeRegistry>
{
	using FIdentityKey = TTuple<FName, FName, int32>;

	double Tolerance = 1e-4;
	bool bFrozen = false;

	TArray<FRigExNodeEntry> Entries;
	TArray<FRigExQueryEntry> Queries;
	TMap<FIdentityKey, int32> IdentityMap;

	TArray<TSharedPtr<FRigExControlNode>> Nodes;

	/** Entry index -> position in identity order */
	TArray<int32> IdentityOrder;

public:
	explicit FRigExNodeRegistry(const double InTolerance);

	double GetTolerance() const { return Tolerance; }
	bool IsFrozen() const { return bFrozen; }

	/**
	 * Register a control point. The same (ChainName, Org, IndexInChain) registered twice
	 * returns the first handle and leaves the registry unchanged.
	 */
	FRigExNodeHandle Register(const FRigExNodeEntry& InEntry);
	FRigExQueryHandle RegisterQuery(const FRigExQueryEntry& InQuery);

	/** Mark InEntry as a chain end whose adjacent point in the same chain is InNeighbor */
	void SetChainEndNeighbor(const FRigExNodeHandle InEntry, const FRigExNodeHandle InNeighbor);

	/**
	 * Merge entries into nodes and bind queries.
	 * @return false if a query found no node; errors go to OutReport
	 */
	bool Freeze(FRigExBuildReport& OutReport);

	int32 NumEntries() const { return Entries.Num(); }
	int32 NumQueries() const { return Queries.Num(); }
	int32 NumNodes() const;

	const FRigExNodeEntry& GetEntry(const int32 InIndex) const { return Entries[InIndex]; }
	const FRigExNodeEntry& GetEntry(const FRigExNodeHandle InHandle) const { return Entries[InHandle.Entry]; }
	const FRigExQueryEntry& GetQuery(const FRigExQueryHandle InHandle) const { return Queries[InHandle.Query]; }

	const TArray<TSharedPtr<FRigExControlNode>>& GetNodes() const;
	const TSharedPtr<FRigExControlNode>& GetNode(const int32 InNodeIndex) const;
	const TSharedPtr<FRigExControlNode>& GetNode(const FRigExNodeHandle InHandle) const;
	const TSharedPtr<FRigExControlNode>& GetNode(const FRigExQueryHandle InHandle) const;

	/** Strict order on entries by (ChainName, Org, IndexInChain), independent of registration order */
	bool IdentityLess(const int32 A, const int32 B) const;

	static bool IdentityLess(const FRigExNodeEntry& A, const FRigExNodeEntry& B);

protected:
	void BuildClusters(TArray<int32>& OutClusterOf) const;
	bool BindQueries(FRigExBuildReport& OutReport);
};
