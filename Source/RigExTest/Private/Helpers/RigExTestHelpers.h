// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Armature/RigExArmature.h"
#include "Core/RigExBuildReport.h"
#include "Core/RigExSkinCommon.h"
#include "Nodes/RigExControlNode.h"

class FRigExSkinContext;
class FRigExNodeRegistry;

namespace RigExTest
{
	constexpr double Tolerance = 1e-4;

	/**
	 * Fluent metarig construction.
	 *
	 *   FMetarigBuilder Builder;
	 *   Builder.Bone("root", FVector(0), FVector(0, 1, 0))
	 *          .Chain("lip", {FVector(0), FVector(1, 0, 0), FVector(2, 0, 0)}, "root")
	 *          .Tag("lip.001", RigExSkin::TypeBasicChain);
	 */
	class FMetarigBuilder
	{
		TSharedRef<FRigExArmature> Armature;

	public:
		FMetarigBuilder();

		FMetarigBuilder& Bone(const FName InName, const FVector& InHead, const FVector& InTail, const FName InParent = NAME_None, const bool bConnected = false);

		/**
		 * Connected bones through the given points, named <Base>.001, <Base>.002... followed by
		 * the symmetry suffix, e.g. Chain("lip", "T.L", ...) -> lip.001.T.L
		 */
		FMetarigBuilder& Chain(const FString& InBase, const FString& InSuffix, const TArray<FVector>& InPoints, const FName InParent = NAME_None);

		FMetarigBuilder& Tag(const FName InBone, const FName InRigType);
		FMetarigBuilder& Param(const FName InBone, const FName InKey, const FString& InValue);

		TSharedRef<FRigExArmature> Build() const { return Armature; }

		static FName ChainBoneName(const FString& InBase, const FString& InSuffix, const int32 InIndex);
	};

	/** Entry without a generator, parented to InParentBone */
	FRigExNodeEntry MakeEntry(
		const FName InChainName, const FName InName, const int32 InIndex, const FVector& InPoint,
		const ERigExSkinRigKind InKind = ERigExSkinRigKind::BasicChain, const FName InParentBone = NAME_None);

	/**
	 * Registry and context over a small armature, for tests that drive the node stages by hand.
	 * Every registered entry gets an org bone at its point so node bones can be generated.
	 */
	class FNodeFixture
	{
	public:
		TSharedRef<FRigExArmature> Armature;
		TSharedRef<FRigExBuildReport> Report;
		TSharedRef<FRigExSkinContext> Context;

		explicit FNodeFixture(const double InTolerance = Tolerance);

		FRigExNodeRegistry& GetRegistry() const;

		/** Adds the org bone when missing */
		FRigExNodeHandle Register(FRigExNodeEntry InEntry);

		bool Freeze() const;
		void Resolve() const;
		void Compose() const;

		/** Node bones only: control, mix parent, reparent */
		void BuildNodeBones() const;

		FRigExControlNode& GetNode(const FRigExNodeHandle InHandle) const;
	};

	bool HasConstraint(const FRigExArmature& InArmature, const FName InBone, const ERigExConstraintKind InKind, const FName InTarget = NAME_None);
}
