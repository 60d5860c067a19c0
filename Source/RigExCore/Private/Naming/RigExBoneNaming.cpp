// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Naming/RigExBoneNaming.h"

#include "Naming/RigExSymmetryName.h"

namespace RigExNaming
{
	const TCHAR* GetRolePrefix(const ERigExBoneRole InRole)
	{
		switch (InRole)
		{
		case ERigExBoneRole::Mechanism: return TEXT("MCH");
		case ERigExBoneRole::Deform: return TEXT("DEF");
		case ERigExBoneRole::Original: return TEXT("ORG");
		default: return TEXT("");
		}
	}

	FString StripPrefix(const FString& InName)
	{
		FRigExSymmetryName Split = FRigExSymmetryName::Parse(InName);
		Split.Prefix.Empty();
		return Split.ToString();
	}

	FName MakeDerivedName(const FName InName, const ERigExBoneRole InRole, const FString& InSuffix)
	{
		FRigExSymmetryName Split = FRigExSymmetryName::Parse(InName);
		Split.Prefix = GetRolePrefix(InRole);
		Split.Base += InSuffix;
		return Split.ToName();
	}

	FName MakeOrgName(const FName InName)
	{
		return IsOrgName(InName) ? InName : MakeDerivedName(InName, ERigExBoneRole::Original);
	}

	bool IsOrgName(const FName InName)
	{
		return InName.ToString().StartsWith(TEXT("ORG-"), ESearchCase::CaseSensitive);
	}
}
