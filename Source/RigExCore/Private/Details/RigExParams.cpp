// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Details/RigExParams.h"

#include "Armature/RigExArmature.h"
#include "Core/RigExBuildReport.h"

FRigExParamReader::FRigExParamReader(const FRigExBone& InBone, FRigExBuildReport& InReport, const FName InRigKind)
	: Bone(InBone), Report(InReport), RigKind(InRigKind)
{
}

bool FRigExParamReader::Has(const FName InKey) const
{
	return Bone.Params.Contains(InKey);
}

bool FRigExParamReader::ParseBool(const FString& InString, bool& OutValue)
{
	const FString Value = InString.TrimStartAndEnd();
	if (Value.Equals(TEXT("true"), ESearchCase::IgnoreCase) || Value == TEXT("1"))
	{
		OutValue = true;
		return true;
	}
	if (Value.Equals(TEXT("false"), ESearchCase::IgnoreCase) || Value == TEXT("0"))
	{
		OutValue = false;
		return true;
	}
	return false;
}

void FRigExParamReader::Read(const FName InKey, bool& OutValue) const
{
	const FString* Value = Bone.Params.Find(InKey);
	if (!Value) { return; }

	if (!ParseBool(*Value, OutValue)) { Fail(FString::Printf(TEXT("Invalid boolean '%s' for parameter '%s'"), **Value, *InKey.ToString())); }
}

void FRigExParamReader::Read(const FName InKey, int32& OutValue) const
{
	const FString* Value = Bone.Params.Find(InKey);
	if (!Value) { return; }

	const FString Trimmed = Value->TrimStartAndEnd();
	if (!Trimmed.IsNumeric() || Trimmed.Contains(TEXT(".")))
	{
		Fail(FString::Printf(TEXT("Invalid integer '%s' for parameter '%s'"), **Value, *InKey.ToString()));
		return;
	}

	OutValue = FCString::Atoi(*Trimmed);
}

void FRigExParamReader::Read(const FName InKey, double& OutValue) const
{
	const FString* Value = Bone.Params.Find(InKey);
	if (!Value) { return; }

	const FString Trimmed = Value->TrimStartAndEnd();
	if (!Trimmed.IsNumeric())
	{
		Fail(FString::Printf(TEXT("Invalid number '%s' for parameter '%s'"), **Value, *InKey.ToString()));
		return;
	}

	OutValue = FCString::Atod(*Trimmed);
}

void FRigExParamReader::Read(const FName InKey, FString& OutValue) const
{
	if (const FString* Value = Bone.Params.Find(InKey)) { OutValue = Value->TrimStartAndEnd(); }
}

void FRigExParamReader::Read(const FName InKey, TArray<double>& OutValues, const int32 InNum) const
{
	const FString* Value = Bone.Params.Find(InKey);
	if (!Value) { return; }

	TArray<FString> Parts;
	Value->ParseIntoArray(Parts, TEXT(","), false);

	if (Parts.Num() != InNum)
	{
		Fail(FString::Printf(TEXT("Parameter '%s' expects %d values, got '%s'"), *InKey.ToString(), InNum, **Value));
		return;
	}

	TArray<double> Parsed;
	Parsed.Reserve(InNum);

	for (FString& Part : Parts)
	{
		Part.TrimStartAndEndInline();
		if (!Part.IsNumeric())
		{
			Fail(FString::Printf(TEXT("Invalid number '%s' in parameter '%s'"), *Part, *InKey.ToString()));
			return;
		}
		Parsed.Add(FCString::Atod(*Part));
	}

	OutValues = MoveTemp(Parsed);
}

void FRigExParamReader::Read(const FName InKey, TArray<bool>& OutValues, const int32 InNum) const
{
	const FString* Value = Bone.Params.Find(InKey);
	if (!Value) { return; }

	TArray<FString> Parts;
	Value->ParseIntoArray(Parts, TEXT(","), false);

	if (Parts.Num() != InNum)
	{
		Fail(FString::Printf(TEXT("Parameter '%s' expects %d values, got '%s'"), *InKey.ToString(), InNum, **Value));
		return;
	}

	TArray<bool> Parsed;
	Parsed.SetNumZeroed(InNum);

	for (int32 i = 0; i < InNum; i++)
	{
		if (!ParseBool(Parts[i], Parsed[i]))
		{
			Fail(FString::Printf(TEXT("Invalid boolean '%s' in parameter '%s'"), *Parts[i], *InKey.ToString()));
			return;
		}
	}

	OutValues = MoveTemp(Parsed);
}

void FRigExParamReader::ReadEnum(const FName InKey, const TArray<FString>& InAccepted, FString& OutValue) const
{
	const FString* Value = Bone.Params.Find(InKey);
	if (!Value) { return; }

	const FString Trimmed = Value->TrimStartAndEnd().ToUpper();
	if (!InAccepted.Contains(Trimmed))
	{
		Fail(FString::Printf(TEXT("Invalid option '%s' for parameter '%s' (expected %s)"), **Value, *InKey.ToString(), *FString::Join(InAccepted, TEXT(", "))));
		return;
	}

	OutValue = Trimmed;
}

void FRigExParamReader::Fail(const FString& InMessage) const
{
	bValid = false;
	Report.AddError(Bone.Name, RigKind, InMessage);
}
