// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

enum class ERigExBuildSeverity : uint8
{
	Warning = 0,
	Error   = 1,
};

struct RIGEXCORE_API FRigExBuildMessage
{
	ERigExBuildSeverity Severity = ERigExBuildSeverity::Error;

	/** Offending metarig bone, or control node name for geometry warnings */
	FName Bone = NAME_None;

	/** Generator type tag, e.g. skin.stretchy_chain */
	FName RigKind = NAME_None;

	FString Text;

	FRigExBuildMessage() = default;

	FRigExBuildMessage(const ERigExBuildSeverity InSeverity, const FName InBone, const FName InRigKind, const FString& InText)
		: Severity(InSeverity), Bone(InBone), RigKind(InRigKind), Text(InText)
	{
	}

	FString ToString() const;
};

/**
 * Errors and warnings produced during one rig generation.
 * Any error makes the whole generation fail; warnings are informative.
 */
class RIGEXCORE_API FRigExBuildReport : public TSharedFromThis<FRigExBuildReport>
{
	TArray<FRigExBuildMessage> Messages;
	int32 NumErrors = 0;

public:
	FRigExBuildReport() = default;

	void AddError(const FName InBone, const FName InRigKind, const FString& InText);
	void AddWarning(const FName InBone, const FName InRigKind, const FString& InText);

	bool HasErrors() const { return NumErrors > 0; }
	int32 GetNumErrors() const { return NumErrors; }
	int32 GetNumWarnings() const { return Messages.Num() - NumErrors; }

	const TArray<FRigExBuildMessage>& GetMessages() const { return Messages; }

	/** First message with the given severity attached to the given bone, or nullptr */
	const FRigExBuildMessage* Find(const FName InBone, const ERigExBuildSeverity InSeverity) const;

	void Reset();

	FString ToString() const;
};
