// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Armature/RigExArmature.h"
#include "Armature/RigExConstraint.h"
#include "Core/RigExSkinCommon.h"
#include "Naming/RigExSymmetryName.h"

class FRigExSkinRig;
class FRigExNodeParent;

struct RIGEXSKIN_API FRigExNodeHandle
{
	int32 Entry = INDEX_NONE;

	FRigExNodeHandle() = default;

	explicit FRigExNodeHandle(const int32 InEntry)
		: Entry(InEntry)
	{
	}

	bool IsValid() const { return Entry != INDEX_NONE; }
	bool operator==(const FRigExNodeHandle& Other) const { return Entry == Other.Entry; }
	bool operator!=(const FRigExNodeHandle& Other) const { return Entry != Other.Entry; }
};

struct RIGEXSKIN_API FRigExQueryHandle
{
	int32 Query = INDEX_NONE;

	FRigExQueryHandle() = default;

	explicit FRigExQueryHandle(const int32 InQuery)
		: Query(InQuery)
	{
	}

	bool IsValid() const { return Query != INDEX_NONE; }
};

/**
 * One generator's request for a control point.
 * Several entries at the same place end up merged into a single FRigExControlNode.
 */
struct RIGEXSKIN_API FRigExNodeEntry
{
	/** Assigned by the registry */
	int32 Index = INDEX_NONE;

	/** Requesting generator, may be null when the registry is used on its own */
	FRigExSkinRig* Rig = nullptr;

	ERigExSkinRigKind Kind = ERigExSkinRigKind::BasicChain;

	/** Base bone of the requesting generator */
	FName ChainName = NAME_None;

	/** Bone defining this point */
	FName Org = NAME_None;

	/** Control bone name this entry would produce if it owned the node */
	FName Name = NAME_None;

	int32 IndexInChain = 0;

	FVector Point = FVector::ZeroVector;

	/** Control orientation this entry asks for */
	FQuat Rotation = FQuat::Identity;
	double Size = 1;

	int32 Priority = 0;

	/** Number of skin generators above the requesting one */
	int32 ParentDepth = 0;

	/** Entries that can't merge only accept others merging into them */
	bool bCanMerge = true;
	bool bNeedsReparent = false;
	bool bMergeParentRotationAndScale = false;

	/** Hide the node control unless another entry merged into it */
	bool bHideLoneControl = false;

	/** Chain connection flags of the requesting generator */
	bool bConnectMirror = false;
	bool bConnectEnds = false;

	/** Parent used when the entry has no generator to build one */
	FName ParentBone = NAME_None;

	/** For chain ends, the adjacent entry of the same chain */
	int32 ChainEndNeighbor = INDEX_NONE;

	/** Entries only merge within the same domain */
	FName MergeDomain = NAME_None;

	/** Parsed once at registration */
	FRigExSymmetryName NameSplit;

	/** Assigned on freeze */
	int32 Node = INDEX_NONE;

	bool IsChainEnd() const { return ChainEndNeighbor != INDEX_NONE; }
};

/** A lookup that binds to whatever node sits at its position, without creating one */
struct RIGEXSKIN_API FRigExQueryEntry
{
	int32 Index = INDEX_NONE;
	FRigExSkinRig* Rig = nullptr;
	FName ChainName = NAME_None;
	FName Org = NAME_None;
	FVector Point = FVector::ZeroVector;
	FName MergeDomain = NAME_None;

	/** Ask the bound node for a reparent bone */
	bool bNeedsReparent = false;

	int32 Node = INDEX_NONE;
};

/** Final transform and parent mechanism of a node */
struct RIGEXSKIN_API FRigExComposedNode
{
	FTransform Transform = FTransform::Identity;
	double Size = 1;

	/** Distinct parent mechanisms, one per symmetry group member after de-duplication */
	TArray<TSharedPtr<FRigExNodeParent>> Parents;

	/** Scale inheritance of the control from its parent mechanism */
	ERigExInheritScale InheritMode = ERigExInheritScale::Average;

	bool bMergeParentRotationAndScale = false;
	bool bNeedsReparent = false;

	FQuat GetRotation() const { return Transform.GetRotation(); }
	FVector GetLocation() const { return Transform.GetLocation(); }
};

/**
 * Merged control point. Identity and owner are fixed once the registry is frozen and
 * resolved; composition then fills the transform and parent mechanism.
 */
class RIGEXSKIN_API FRigExControlNode : public TSharedFromThis<FRigExControlNode>
{
	friend class FRigExNodeRegistry;
	friend class FRigExOwnershipResolver;
	friend class FRigExParentComposer;

	int32 Index = INDEX_NONE;
	FVector Point = FVector::ZeroVector;

	/** Merged entries, ranked best first after resolution */
	TArray<int32> Entries;
	TArray<int32> Queries;

	int32 Owner = INDEX_NONE;

	/** Owner plus its symmetry siblings, one per tag set */
	TArray<int32> SymmetryGroup;

	FRigExComposedNode Composed;
	bool bComposed = false;

	/** Every parent built for this node or for entries merged into it */
	TArray<TSharedPtr<FRigExNodeParent>> ParentCache;

	/** Parent built for each entry, by entry index */
	TMap<int32, TSharedPtr<FRigExNodeParent>> EntryParents;

public:
	FRigExControlNode() = default;

	int32 GetIndex() const { return Index; }
	const FVector& GetPoint() const { return Point; }
	const TArray<int32>& GetEntries() const { return Entries; }
	const TArray<int32>& GetQueries() const { return Queries; }

	bool IsResolved() const { return Owner != INDEX_NONE; }
	int32 GetOwner() const { return Owner; }
	const TArray<int32>& GetSymmetryGroup() const { return SymmetryGroup; }
	bool HasSymmetryGroup() const { return SymmetryGroup.Num() > 1; }
	bool IsMerged() const { return Entries.Num() > 1; }
	bool ContainsEntry(const int32 InEntry) const { return Entries.Contains(InEntry); }

	bool IsComposed() const { return bComposed; }
	const FRigExComposedNode& GetComposed() const
	{
		checkf(bComposed, TEXT("Control node %d read before composition"), Index);
		return Composed;
	}

	const TArray<TSharedPtr<FRigExNodeParent>>& GetParentCache() const { return ParentCache; }
	TSharedPtr<FRigExNodeParent> GetEntryParent(const int32 InEntry) const;


	//~ Bones created for the node

	FName ControlBone = NAME_None;
	FName MixParentBone = NAME_None;
	FName ReparentBone = NAME_None;

	/** Bone that carries the node's parent motion: mix parent or single parent output */
	FName GetParentOutputBone() const;
};
