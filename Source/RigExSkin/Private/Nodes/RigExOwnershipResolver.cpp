// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Nodes/RigExOwnershipResolver.h"

#include "Core/RigExLog.h"
#include "Nodes/RigExNodeRegistry.h"

FRigExOwnershipRank::FRigExOwnershipRank(const FRigExNodeEntry& InEntry)
	: bNotAnchor(InEntry.Kind != ERigExSkinRigKind::Anchor),
	  NegPriority(-InEntry.Priority),
	  ParentDepth(InEntry.ParentDepth),
	  bUntagged(!InEntry.NameSplit.HasSymmetry()),
	  ChainName(InEntry.ChainName),
	  IndexInChain(InEntry.IndexInChain),
	  Org(InEntry.Org)
{
}

bool FRigExOwnershipRank::operator<(const FRigExOwnershipRank& Other) const
{
	if (bNotAnchor != Other.bNotAnchor) { return !bNotAnchor; }
	if (NegPriority != Other.NegPriority) { return NegPriority < Other.NegPriority; }
	if (ParentDepth != Other.ParentDepth) { return ParentDepth < Other.ParentDepth; }
	if (bUntagged != Other.bUntagged) { return !bUntagged; }
	if (const int32 Cmp = ChainName.Compare(Other.ChainName)) { return Cmp < 0; }
	if (IndexInChain != Other.IndexInChain) { return IndexInChain < Other.IndexInChain; }
	return Org.Compare(Other.Org) < 0;
}

bool FRigExOwnershipRank::operator==(const FRigExOwnershipRank& Other) const
{
	return bNotAnchor == Other.bNotAnchor &&
		NegPriority == Other.NegPriority &&
		ParentDepth == Other.ParentDepth &&
		bUntagged == Other.bUntagged &&
		ChainName == Other.ChainName &&
		IndexInChain == Other.IndexInChain &&
		Org == Other.Org;
}

FString FRigExOwnershipRank::ToString() const
{
	return FString::Printf(
		TEXT("(%s, %d, %d, %s, %s, %d)"),
		bNotAnchor ? TEXT("chain") : TEXT("anchor"), -NegPriority, ParentDepth,
		bUntagged ? TEXT("untagged") : TEXT("tagged"), *ChainName.ToString(), IndexInChain);
}

FRigExOwnershipResolver::FRigExOwnershipResolver(const TSharedRef<FRigExNodeRegistry>& InRegistry)
	: Registry(InRegistry)
{
}

bool FRigExOwnershipResolver::RankLess(const int32 A, const int32 B) const
{
	return FRigExOwnershipRank(Registry->GetEntry(A)) < FRigExOwnershipRank(Registry->GetEntry(B));
}

void FRigExOwnershipResolver::Resolve(FRigExControlNode& InNode) const
{
	checkf(Registry->IsFrozen(), TEXT("Ownership resolved before the registry was frozen"));
	checkf(!InNode.IsResolved(), TEXT("Control node %d resolved twice"), InNode.Index);
	check(!InNode.Entries.IsEmpty());

	InNode.Entries.Sort([&](const int32 A, const int32 B) { return RankLess(A, B); });

	const FRigExNodeEntry& Owner = Registry->GetEntry(InNode.Entries[0]);
	InNode.Owner = Owner.Index;
	InNode.Point = Owner.Point;

	// Symmetry group: owner plus same-kind siblings, one per tag set, best ranked wins
	InNode.SymmetryGroup.Reset();
	InNode.SymmetryGroup.Add(Owner.Index);

	if (Owner.NameSplit.HasSymmetry())
	{
		TSet<FString> SeenKeys;
		SeenKeys.Add(Owner.NameSplit.GetSymmetryKey());

		for (int32 i = 1; i < InNode.Entries.Num(); i++)
		{
			const FRigExNodeEntry& Entry = Registry->GetEntry(InNode.Entries[i]);
			if (Entry.Kind != Owner.Kind) { continue; }
			if (!FRigExSymmetryName::AreSiblings(Owner.NameSplit, Entry.NameSplit)) { continue; }

			bool bAlreadySeen = false;
			SeenKeys.Add(Entry.NameSplit.GetSymmetryKey(), &bAlreadySeen);
			if (bAlreadySeen) { continue; }

			InNode.SymmetryGroup.Add(Entry.Index);
		}
	}

	if (FRigExLog::WouldLog(ERigExLogCategory::Ownership, ERigExLogVerbosity::Verbose))
	{
		FRigExLog::Log(
			ERigExLogCategory::Ownership, ERigExLogVerbosity::Verbose,
			FString::Printf(
				TEXT("Node %d owned by %s %s, %d candidates, %d in symmetry group"),
				InNode.Index, *Owner.Name.ToString(), *FRigExOwnershipRank(Owner).ToString(),
				InNode.Entries.Num(), InNode.SymmetryGroup.Num()));
	}
}

void FRigExOwnershipResolver::ResolveAll() const
{
	RIGEX_LOG_SECTION(Ownership, "Resolve");

	int32 NumGroups = 0;
	for (const TSharedPtr<FRigExControlNode>& Node : Registry->GetNodes())
	{
		Resolve(*Node);
		if (Node->HasSymmetryGroup()) { NumGroups++; }
	}

	RIGEX_LOG_INFO(Ownership, "Resolved %d nodes, %d symmetry groups", Registry->NumNodes(), NumGroups);
}

int32 FRigExOwnershipResolver::FindSibling(const FRigExControlNode& InNode, const FRigExSymmetryName& InName) const
{
	const FString Key = InName.GetSymmetryKey();
	for (const int32 EntryIndex : InNode.Entries)
	{
		if (Registry->GetEntry(EntryIndex).NameSplit.GetSymmetryKey() == Key) { return EntryIndex; }
	}
	return INDEX_NONE;
}

int32 FRigExOwnershipResolver::FindBestMirror(const int32 InEntry) const
{
	const FRigExNodeEntry& Entry = Registry->GetEntry(InEntry);
	if (!Entry.NameSplit.HasSymmetry()) { return INDEX_NONE; }

	const FRigExControlNode& Node = *Registry->GetNode(Entry.Node);
	checkf(Node.IsResolved(), TEXT("Mirror lookup on an unresolved node"));

	const bool Flips[3][2] = {{true, true}, {true, false}, {false, true}};
	for (const auto& Flip : Flips)
	{
		const FRigExSymmetryName Mirror = Entry.NameSplit.Mirrored(Flip[0], Flip[1]);
		if (Mirror == Entry.NameSplit) { continue; }

		const int32 Found = FindSibling(Node, Mirror);
		if (Found != INDEX_NONE && Found != InEntry) { return Found; }
	}

	return INDEX_NONE;
}
