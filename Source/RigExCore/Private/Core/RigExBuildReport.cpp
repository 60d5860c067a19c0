// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Core/RigExBuildReport.h"

#include "Core/RigExLog.h"

FString FRigExBuildMessage::ToString() const
{
	return FString::Printf(
		TEXT("%s: %s (%s): %s"),
		Severity == ERigExBuildSeverity::Error ? TEXT("Error") : TEXT("Warning"),
		*Bone.ToString(), *RigKind.ToString(), *Text);
}

void FRigExBuildReport::AddError(const FName InBone, const FName InRigKind, const FString& InText)
{
	const FRigExBuildMessage& Message = Messages.Emplace_GetRef(ERigExBuildSeverity::Error, InBone, InRigKind, InText);
	NumErrors++;
	RIGEX_LOG_ERROR(Generator, "%s", *Message.ToString());
}

void FRigExBuildReport::AddWarning(const FName InBone, const FName InRigKind, const FString& InText)
{
	const FRigExBuildMessage& Message = Messages.Emplace_GetRef(ERigExBuildSeverity::Warning, InBone, InRigKind, InText);
	RIGEX_LOG_WARNING(Generator, "%s", *Message.ToString());
}

const FRigExBuildMessage* FRigExBuildReport::Find(const FName InBone, const ERigExBuildSeverity InSeverity) const
{
	return Messages.FindByPredicate([&](const FRigExBuildMessage& Message) { return Message.Bone == InBone && Message.Severity == InSeverity; });
}

void FRigExBuildReport::Reset()
{
	Messages.Reset();
	NumErrors = 0;
}

FString FRigExBuildReport::ToString() const
{
	TArray<FString> Lines;
	Lines.Reserve(Messages.Num());
	for (const FRigExBuildMessage& Message : Messages) { Lines.Add(Message.ToString()); }
	return FString::Join(Lines, TEXT("\n"));
}
