// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Armature/RigExArmature.h"
#include "Core/RigExSkinCommon.h"
#include "Nodes/RigExControlNode.h"

class FRigExBuildReport;
class FRigExNodeRegistry;
class FRigExOwnershipResolver;
class FRigExParentComposer;

/**
 * Shared state of one generation, passed explicitly to every skin generator.
 * Owns the working armature; the registry is created for the collection stage and
 * stays read-only once frozen.
 */
class RIGEXSKIN_API FRigExSkinContext : public TSharedFromThis<FRigExSkinContext>
{
	TSharedRef<FRigExArmature> Armature;
	FRigExBuildReport& Report;

public:
	FRigExSkinContext(const TSharedRef<FRigExArmature>& InArmature, FRigExBuildReport& InReport);

	/** Source metarig, bone names as authored */
	const FRigExArmature* Metarig = nullptr;

	TSharedPtr<FRigExNodeRegistry> Registry;
	TSharedPtr<FRigExOwnershipResolver> Resolver;
	TSharedPtr<FRigExParentComposer> Composer;

	FName MergeDomain = FName("SkinControls");
	ERigExSkinStage Stage = ERigExSkinStage::None;

	FRigExArmature& GetArmature() const { return *Armature; }
	const TSharedRef<FRigExArmature>& GetArmatureRef() const { return Armature; }
	FRigExBuildReport& GetReport() const { return Report; }
	bool HasErrors() const;

	FRigExNodeRegistry& GetRegistry() const;
	const FRigExOwnershipResolver& GetResolver() const;

	const FRigExNodeEntry& GetEntry(const int32 InEntry) const;
	const FRigExNodeEntry& GetEntry(const FRigExNodeHandle InHandle) const { return GetEntry(InHandle.Entry); }
	FRigExControlNode& GetNode(const FRigExNodeHandle InHandle) const;
	FRigExControlNode& GetNodeOfEntry(const int32 InEntry) const;
	FRigExControlNode& GetNode(const FRigExQueryHandle InHandle) const;

	//~ Armature helpers

	FRigExBone& GetBone(const FName InName) const { return Armature->GetChecked(InName); }
	FName CopyBone(const FName InSource, const FName InNewName, const bool bCopyBBone = false) const;
	void SetParent(const FName InChild, const FName InParent, const ERigExInheritScale InInheritScale = ERigExInheritScale::Full, const bool bConnected = false) const;
	FRigExConstraint& MakeConstraint(const FName InBone, const ERigExConstraintKind InKind, const FName InName, const FName InTarget = NAME_None) const;

	void AddError(const FName InBone, const ERigExSkinRigKind InKind, const FString& InText) const;
	void AddWarning(const FName InBone, const ERigExSkinRigKind InKind, const FString& InText) const;
};
