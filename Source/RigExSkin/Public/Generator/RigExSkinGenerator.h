// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Armature/RigExArmature.h"
#include "Core/RigExBuildReport.h"
#include "Core/RigExSkinCommon.h"

class FRigExSkinContext;
class FRigExSkinRig;
class FRigExNodeParent;

/**
 * Turns a tagged metarig into a generated rig.
 *
 * Initialize  duplicate the metarig, rename bones to ORG-, create one generator per tagged bone
 * Collect     register control points, then freeze the registry
 * Resolve     pick owners and symmetry groups, validate per generator
 * Compose     transforms and parent mechanisms of every node
 * Build       generate, parent, then rig: nodes first, generators next, parent mechanisms last
 *
 * Any error aborts at the end of the stage that produced it; the metarig is never modified.
 */
class RIGEXSKIN_API FRigExSkinGenerator : public TSharedFromThis<FRigExSkinGenerator>
{
	TSharedRef<FRigExArmature> Metarig;

	FRigExBuildReport Report;
	TSharedPtr<FRigExSkinContext> Context;

	TArray<TSharedPtr<FRigExSkinRig>> Rigs;
	TMap<FName, FRigExSkinRig*> RigsByBone;

	/** Every parent mechanism of every node, inner layers before the layers wrapping them */
	TArray<TSharedPtr<FRigExNodeParent>> Parents;

	ERigExSkinStage Stage = ERigExSkinStage::None;
	FString BuildLog;

public:
	explicit FRigExSkinGenerator(const TSharedRef<FRigExArmature>& InMetarig);

	/** Nodes only merge within one domain; generators of a single run share it */
	FName MergeDomain = FName("SkinControls");

	/**
	 * Run every stage once.
	 * @param OutRig set to the generated armature on success only
	 * @return false if any error was reported, see GetReport()
	 */
	bool Generate(TSharedPtr<FRigExArmature>& OutRig);

	const FRigExBuildReport& GetReport() const { return Report; }
	ERigExSkinStage GetStage() const { return Stage; }

	/** Log lines emitted during the last run, when build log accumulation is enabled */
	const FString& GetBuildLog() const { return BuildLog; }

	FRigExSkinContext& GetContext() const;
	const TArray<TSharedPtr<FRigExSkinRig>>& GetRigs() const { return Rigs; }

	/** Generator created for a tagged metarig bone, by its authored name */
	FRigExSkinRig* FindRig(const FName InMetaBone) const { return RigsByBone.FindRef(InMetaBone); }

protected:
	bool Run();

	bool InitializeRigs();
	bool CollectNodes();
	bool ResolveNodes();
	bool ComposeNodes();
	bool BuildBones();

	void CollectParents();

	void SetStage(const ERigExSkinStage InStage);
	bool CheckErrors(const TCHAR* InStageName);
};
