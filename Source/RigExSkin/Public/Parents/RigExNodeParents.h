// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Armature/RigExArmature.h"

class FRigExSkinContext;
class FRigExStretchyChainBuilder;

enum class ERigExNodeParentKind : uint8
{
	Bone = 0,
	Offset,
	ChainPropagate,
};

/**
 * Parent mechanism of a control node. Layers wrap an inner parent and add motion on top of it;
 * equal mechanisms are shared between the entries of a node.
 */
class RIGEXSKIN_API FRigExNodeParent : public TSharedFromThis<FRigExNodeParent>
{
protected:
	FName OutputBone = NAME_None;

public:
	virtual ~FRigExNodeParent() = default;

	virtual ERigExNodeParentKind GetKind() const = 0;
	virtual bool Equals(const FRigExNodeParent& Other) const = 0;
	virtual FString ToString() const = 0;

	/** How the control inherits scale when parented directly to this mechanism */
	virtual ERigExInheritScale GetInheritScale() const { return ERigExInheritScale::Average; }

	/** Bone the control (or mix parent) follows; valid once bones are generated */
	FName GetOutputBone() const { return OutputBone; }

	virtual void GenerateBones(const FRigExSkinContext& InContext)
	{
	}

	virtual void ParentBones(const FRigExSkinContext& InContext)
	{
	}

	virtual void RigBones(const FRigExSkinContext& InContext)
	{
	}
};

/** Existing bone used as is */
class RIGEXSKIN_API FRigExParentBone final : public FRigExNodeParent
{
public:
	explicit FRigExParentBone(const FName InBone);

	virtual ERigExNodeParentKind GetKind() const override { return ERigExNodeParentKind::Bone; }
	virtual bool Equals(const FRigExNodeParent& Other) const override;
	virtual FString ToString() const override;
};

/** Mechanism bone parented to an inner mechanism */
class RIGEXSKIN_API FRigExParentLayer : public FRigExNodeParent
{
protected:
	TSharedPtr<FRigExNodeParent> Inner;

	/** Node and entry the layer is built for */
	int32 Node = INDEX_NONE;
	int32 Entry = INDEX_NONE;

public:
	FRigExParentLayer(const TSharedPtr<FRigExNodeParent>& InInner, const int32 InNode, const int32 InEntry);

	const TSharedPtr<FRigExNodeParent>& GetInner() const { return Inner; }

	virtual void GenerateBones(const FRigExSkinContext& InContext) override;
	virtual void ParentBones(const FRigExSkinContext& InContext) override;

protected:
	bool InnerEquals(const FRigExParentLayer& Other) const;
	virtual FString GetBoneSuffix() const = 0;
};

/**
 * Adds the local motion of driver nodes, weighted by falloff, on top of the inner parent.
 * Copies location only, or the full local transform when the node merges parent rotation and scale.
 */
class RIGEXSKIN_API FRigExParentOffset final : public FRigExParentLayer
{
public:
	struct FDriver
	{
		int32 Node = INDEX_NONE;
		double Influence = 1;
	};

protected:
	TArray<FDriver> Drivers;
	bool bCopyFullTransform = false;

public:
	FRigExParentOffset(const TSharedPtr<FRigExNodeParent>& InInner, const int32 InNode, const int32 InEntry, const bool bInCopyFullTransform);

	void AddCopyLocalLocation(const int32 InDriverNode, const double InInfluence);

	const TArray<FDriver>& GetDrivers() const { return Drivers; }
	bool CopiesFullTransform() const { return bCopyFullTransform; }

	virtual ERigExNodeParentKind GetKind() const override { return ERigExNodeParentKind::Offset; }
	virtual bool Equals(const FRigExNodeParent& Other) const override;
	virtual FString ToString() const override;

	virtual void RigBones(const FRigExSkinContext& InContext) override;

protected:
	virtual FString GetBoneSuffix() const override { return TEXT("_offset"); }
};

/** Exposes twist and scale propagated inside a stretchy chain as parent motion */
class RIGEXSKIN_API FRigExParentChainPropagate final : public FRigExParentLayer
{
	const FRigExStretchyChainBuilder* Builder = nullptr;
	int32 IndexInChain = 0;

public:
	FRigExParentChainPropagate(const TSharedPtr<FRigExNodeParent>& InInner, const int32 InNode, const int32 InEntry, const FRigExStretchyChainBuilder* InBuilder, const int32 InIndexInChain);

	virtual ERigExNodeParentKind GetKind() const override { return ERigExNodeParentKind::ChainPropagate; }
	virtual bool Equals(const FRigExNodeParent& Other) const override;
	virtual FString ToString() const override;

	virtual ERigExInheritScale GetInheritScale() const override { return ERigExInheritScale::Full; }

	virtual void GenerateBones(const FRigExSkinContext& InContext) override;
	virtual void RigBones(const FRigExSkinContext& InContext) override;

protected:
	virtual FString GetBoneSuffix() const override { return TEXT("_parent"); }
};
