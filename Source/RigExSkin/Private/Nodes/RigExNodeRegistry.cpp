// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Nodes/RigExNodeRegistry.h"

#include "RigExH.h"
#include "Core/RigExBuildReport.h"
#include "Core/RigExLog.h"

namespace RigExNodeRegistry
{
	static int32 FindRoot(TArray<int32>& Parents, int32 Index)
	{
		while (Parents[Index] != Index)
		{
			Parents[Index] = Parents[Parents[Index]];
			Index = Parents[Index];
		}
		return Index;
	}

	template <typename Func>
	static void ForEachNeighborCell(const TMap<FInt64Vector3, TArray<int32>>& Grid, const FInt64Vector3& Cell, Func&& Callback)
	{
		for (int64 X = -1; X <= 1; X++)
		{
			for (int64 Y = -1; Y <= 1; Y++)
			{
				for (int64 Z = -1; Z <= 1; Z++)
				{
					if (const TArray<int32>* Items = Grid.Find(FInt64Vector3(Cell.X + X, Cell.Y + Y, Cell.Z + Z)))
					{
						for (const int32 Item : *Items) { Callback(Item); }
					}
				}
			}
		}
	}
}

FRigExNodeRegistry::FRigExNodeRegistry(const double InTolerance)
	: Tolerance(RigEx::SafeScalarTolerance(InTolerance))
{
}

FRigExNodeHandle FRigExNodeRegistry::Register(const FRigExNodeEntry& InEntry)
{
	checkf(!bFrozen, TEXT("Control node '%s' registered after the registry was frozen"), *InEntry.Name.ToString());

	const FIdentityKey Key(InEntry.ChainName, InEntry.Org, InEntry.IndexInChain);
	if (const int32* Existing = IdentityMap.Find(Key))
	{
		RIGEX_LOG_VERBOSE(Registry, "Duplicate registration of %s [%s #%d] ignored", *InEntry.Name.ToString(), *InEntry.ChainName.ToString(), InEntry.IndexInChain);
		return FRigExNodeHandle(*Existing);
	}

	const int32 Index = Entries.Add(InEntry);
	FRigExNodeEntry& Entry = Entries[Index];
	Entry.Index = Index;
	Entry.Node = INDEX_NONE;
	Entry.ChainEndNeighbor = INDEX_NONE;
	Entry.NameSplit = FRigExSymmetryName::Parse(Entry.Name);

	IdentityMap.Add(Key, Index);

	RIGEX_LOG_VERBOSE(Registry, "Registered %s at (%s) [%s #%d]", *Entry.Name.ToString(), *Entry.Point.ToString(), *Entry.ChainName.ToString(), Entry.IndexInChain);
	return FRigExNodeHandle(Index);
}

FRigExQueryHandle FRigExNodeRegistry::RegisterQuery(const FRigExQueryEntry& InQuery)
{
	checkf(!bFrozen, TEXT("Control query for '%s' registered after the registry was frozen"), *InQuery.Org.ToString());

	const int32 Index = Queries.Add(InQuery);
	Queries[Index].Index = Index;
	Queries[Index].Node = INDEX_NONE;
	return FRigExQueryHandle(Index);
}

void FRigExNodeRegistry::SetChainEndNeighbor(const FRigExNodeHandle InEntry, const FRigExNodeHandle InNeighbor)
{
	checkf(!bFrozen, TEXT("Chain neighbors must be set before the registry is frozen"));
	check(Entries.IsValidIndex(InEntry.Entry) && Entries.IsValidIndex(InNeighbor.Entry));

	Entries[InEntry.Entry].ChainEndNeighbor = InNeighbor.Entry;
}

bool FRigExNodeRegistry::IdentityLess(const FRigExNodeEntry& A, const FRigExNodeEntry& B)
{
	if (const int32 Cmp = A.ChainName.Compare(B.ChainName)) { return Cmp < 0; }
	if (const int32 Cmp = A.Org.Compare(B.Org)) { return Cmp < 0; }
	return A.IndexInChain < B.IndexInChain;
}

bool FRigExNodeRegistry::IdentityLess(const int32 A, const int32 B) const
{
	if (!IdentityOrder.IsEmpty()) { return IdentityOrder[A] < IdentityOrder[B]; }
	return IdentityLess(Entries[A], Entries[B]);
}

bool FRigExNodeRegistry::Freeze(FRigExBuildReport& OutReport)
{
	checkf(!bFrozen, TEXT("Control node registry frozen twice"));

	RIGEX_LOG_SECTION(Registry, "Freeze");

	// Identity order
	{
		TArray<int32> Sorted;
		Sorted.Reserve(Entries.Num());
		for (int32 i = 0; i < Entries.Num(); i++) { Sorted.Add(i); }
		Sorted.Sort([&](const int32 A, const int32 B) { return IdentityLess(Entries[A], Entries[B]); });

		IdentityOrder.SetNumUninitialized(Entries.Num());
		for (int32 i = 0; i < Sorted.Num(); i++) { IdentityOrder[Sorted[i]] = i; }
	}

	TArray<int32> ClusterOf;
	BuildClusters(ClusterOf);

	// Gather clusters, each sorted by identity
	TMap<int32, TArray<int32>> Clusters;
	for (int32 i = 0; i < Entries.Num(); i++) { Clusters.FindOrAdd(ClusterOf[i]).Add(i); }

	TArray<TArray<int32>> OrderedClusters;
	OrderedClusters.Reserve(Clusters.Num());
	for (TPair<int32, TArray<int32>>& Pair : Clusters)
	{
		Pair.Value.Sort([&](const int32 A, const int32 B) { return IdentityOrder[A] < IdentityOrder[B]; });
		OrderedClusters.Add(MoveTemp(Pair.Value));
	}

	OrderedClusters.Sort([&](const TArray<int32>& A, const TArray<int32>& B) { return IdentityOrder[A[0]] < IdentityOrder[B[0]]; });

	Nodes.Reset(OrderedClusters.Num());
	for (const TArray<int32>& Cluster : OrderedClusters)
	{
		TSharedPtr<FRigExControlNode> Node = MakeShared<FRigExControlNode>();
		Node->Index = Nodes.Num();
		Node->Point = Entries[Cluster[0]].Point;
		Node->Entries = Cluster;

		for (const int32 EntryIndex : Cluster) { Entries[EntryIndex].Node = Node->Index; }

		if (Cluster.Num() > 1)
		{
			RIGEX_LOG_VERBOSE(Registry, "Node %d merges %d entries around %s", Node->Index, Cluster.Num(), *Entries[Cluster[0]].Name.ToString());
		}

		Nodes.Add(Node);
	}

	bFrozen = true;

	RIGEX_LOG_INFO(Registry, "Merged %d entries into %d nodes", Entries.Num(), Nodes.Num());

	return BindQueries(OutReport);
}

void FRigExNodeRegistry::BuildClusters(TArray<int32>& OutClusterOf) const
{
	const int32 NumEntries = Entries.Num();

	TMap<FInt64Vector3, TArray<int32>> Grid;
	Grid.Reserve(NumEntries);
	for (int32 i = 0; i < NumEntries; i++) { Grid.FindOrAdd(RigEx::GridCell(Entries[i].Point, Tolerance)).Add(i); }

	// Candidate pairs, keyed by identity rank so the join order is stable
	TArray<uint64> Pairs;
	const double SqrTolerance = FMath::Square(Tolerance);

	for (int32 i = 0; i < NumEntries; i++)
	{
		const FRigExNodeEntry& A = Entries[i];
		RigExNodeRegistry::ForEachNeighborCell(
			Grid, RigEx::GridCell(A.Point, Tolerance), [&](const int32 j)
			{
				if (j <= i) { return; }

				const FRigExNodeEntry& B = Entries[j];
				if (A.MergeDomain != B.MergeDomain) { return; }
				if (!A.bCanMerge && !B.bCanMerge) { return; }
				if (FVector::DistSquared(A.Point, B.Point) > SqrTolerance) { return; }

				const int32 RankA = IdentityOrder[i];
				const int32 RankB = IdentityOrder[j];
				Pairs.Add(RigEx::H64(FMath::Min(RankA, RankB), FMath::Max(RankA, RankB)));
			});
	}

	Pairs.Sort();

	TArray<int32> EntryAtRank;
	EntryAtRank.SetNumUninitialized(NumEntries);
	for (int32 i = 0; i < NumEntries; i++) { EntryAtRank[IdentityOrder[i]] = i; }

	// Union-find over entries; a cluster holding an entry that can't merge accepts
	// mergeable entries but never another such cluster.
	TArray<int32> Parents;
	TArray<bool> Locked;
	Parents.SetNumUninitialized(NumEntries);
	Locked.SetNumUninitialized(NumEntries);
	for (int32 i = 0; i < NumEntries; i++)
	{
		Parents[i] = i;
		Locked[i] = !Entries[i].bCanMerge;
	}

	for (const uint64 Pair : Pairs)
	{
		const int32 RootA = RigExNodeRegistry::FindRoot(Parents, EntryAtRank[RigEx::H64A(Pair)]);
		const int32 RootB = RigExNodeRegistry::FindRoot(Parents, EntryAtRank[RigEx::H64B(Pair)]);

		if (RootA == RootB) { continue; }
		if (Locked[RootA] && Locked[RootB])
		{
			RIGEX_LOG_VERBOSE(Registry, "%s and %s both refuse merging, kept apart", *Entries[RootA].Name.ToString(), *Entries[RootB].Name.ToString());
			continue;
		}

		const bool bAFirst = IdentityOrder[RootA] < IdentityOrder[RootB];
		const int32 NewRoot = bAFirst ? RootA : RootB;
		const int32 OldRoot = bAFirst ? RootB : RootA;

		Parents[OldRoot] = NewRoot;
		Locked[NewRoot] = Locked[RootA] || Locked[RootB];
	}

	OutClusterOf.SetNumUninitialized(NumEntries);
	for (int32 i = 0; i < NumEntries; i++) { OutClusterOf[i] = RigExNodeRegistry::FindRoot(Parents, i); }
}

bool FRigExNodeRegistry::BindQueries(FRigExBuildReport& OutReport)
{
	if (Queries.IsEmpty()) { return true; }

	TMap<FInt64Vector3, TArray<int32>> Grid;
	for (int32 i = 0; i < Entries.Num(); i++) { Grid.FindOrAdd(RigEx::GridCell(Entries[i].Point, Tolerance)).Add(i); }

	const double SqrTolerance = FMath::Square(Tolerance);
	bool bAllBound = true;

	for (FRigExQueryEntry& Query : Queries)
	{
		int32 Best = INDEX_NONE;
		double BestDist = MAX_dbl;

		RigExNodeRegistry::ForEachNeighborCell(
			Grid, RigEx::GridCell(Query.Point, Tolerance), [&](const int32 j)
			{
				const FRigExNodeEntry& Entry = Entries[j];
				if (Entry.MergeDomain != Query.MergeDomain) { return; }

				const double Dist = FVector::DistSquared(Entry.Point, Query.Point);
				if (Dist > SqrTolerance) { return; }

				if (Best == INDEX_NONE || Dist < BestDist || (Dist == BestDist && IdentityOrder[j] < IdentityOrder[Best]))
				{
					Best = j;
					BestDist = Dist;
				}
			});

		if (Best == INDEX_NONE)
		{
			OutReport.AddError(Query.Org, RigExSkin::TypeGlue, FString::Printf(TEXT("No control node found at %s"), *Query.Point.ToString()));
			bAllBound = false;
			continue;
		}

		Query.Node = Entries[Best].Node;
		Nodes[Query.Node]->Queries.Add(Query.Index);

		RIGEX_LOG_VERBOSE(Registry, "Query %s bound to node %d", *Query.Org.ToString(), Query.Node);
	}

	return bAllBound;
}

int32 FRigExNodeRegistry::NumNodes() const
{
	checkf(bFrozen, TEXT("Control nodes read before the registry was frozen"));
	return Nodes.Num();
}

const TArray<TSharedPtr<FRigExControlNode>>& FRigExNodeRegistry::GetNodes() const
{
	checkf(bFrozen, TEXT("Control nodes read before the registry was frozen"));
	return Nodes;
}

const TSharedPtr<FRigExControlNode>& FRigExNodeRegistry::GetNode(const int32 InNodeIndex) const
{
	checkf(bFrozen, TEXT("Control nodes read before the registry was frozen"));
	return Nodes[InNodeIndex];
}

const TSharedPtr<FRigExControlNode>& FRigExNodeRegistry::GetNode(const FRigExNodeHandle InHandle) const
{
	return GetNode(Entries[InHandle.Entry].Node);
}

const TSharedPtr<FRigExControlNode>& FRigExNodeRegistry::GetNode(const FRigExQueryHandle InHandle) const
{
	const int32 NodeIndex = Queries[InHandle.Query].Node;
	checkf(NodeIndex != INDEX_NONE, TEXT("Query for '%s' is not bound to a node"), *Queries[InHandle.Query].Org.ToString());
	return GetNode(NodeIndex);
}
