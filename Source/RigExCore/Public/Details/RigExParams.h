// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

struct FRigExBone;
class FRigExBuildReport;

/**
 * Typed access to the string parameters stored on a metarig bone.
 * Missing keys keep the caller's default; malformed values are reported as
 * configuration errors and also keep the default.
 */
class RIGEXCORE_API FRigExParamReader
{
	const FRigExBone& Bone;
	FRigExBuildReport& Report;
	FName RigKind = NAME_None;
	mutable bool bValid = true;

public:
	FRigExParamReader(const FRigExBone& InBone, FRigExBuildReport& InReport, const FName InRigKind);

	bool Has(const FName InKey) const;

	void Read(const FName InKey, bool& OutValue) const;
	void Read(const FName InKey, int32& OutValue) const;
	void Read(const FName InKey, double& OutValue) const;
	void Read(const FName InKey, FString& OutValue) const;

	/** Comma separated list with exactly InNum entries */
	void Read(const FName InKey, TArray<double>& OutValues, const int32 InNum) const;
	void Read(const FName InKey, TArray<bool>& OutValues, const int32 InNum) const;

	/** Read an option and check it against a set of accepted literals */
	void ReadEnum(const FName InKey, const TArray<FString>& InAccepted, FString& OutValue) const;

	void Fail(const FString& InMessage) const;

	bool IsValid() const { return bValid; }

	static bool ParseBool(const FString& InString, bool& OutValue);
};
