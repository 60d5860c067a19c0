// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

namespace RigExNaming
{
	/** Characters allowed between a base name and a symmetry tag */
	RIGEXCORE_API bool IsTagSeparator(const TCHAR InChar);

	RIGEXCORE_API const TArray<TPair<FString, FString>>& GetLeftRightTags();
	RIGEXCORE_API const TArray<TPair<FString, FString>>& GetTopBottomTags();
	RIGEXCORE_API const TArray<FString>& GetKnownPrefixes();
}

/**
 * Bone or control name split into its symmetry parts:
 *   [PREFIX-]Base[<sep>TopBottom][<sep>LeftRight][.NNN]
 *
 * Spelling and separators are retained so ToString() reproduces the parsed name.
 * Sides are +1 for Left / Top, -1 for Right / Bottom, 0 when untagged.
 */
struct RIGEXCORE_API FRigExSymmetryName
{
	FString Prefix;
	FString Base;

	int8 TopBottom = 0;
	FString TopBottomTag;
	TCHAR TopBottomSeparator = TEXT('.');

	int8 LeftRight = 0;
	FString LeftRightTag;
	TCHAR LeftRightSeparator = TEXT('.');

	/** Trailing numeric suffix digits, without the dot */
	FString Number;

	FRigExSymmetryName() = default;

	static FRigExSymmetryName Parse(const FString& InName);
	static FRigExSymmetryName Parse(const FName InName) { return Parse(InName.ToString()); }

	FString ToString() const;
	FName ToName() const { return FName(ToString()); }

	bool HasSymmetry() const { return TopBottom != 0 || LeftRight != 0; }

	/** Same name with the requested axes flipped, keeping tag spelling */
	FRigExSymmetryName Mirrored(const bool bFlipLeftRight, const bool bFlipTopBottom) const;

	/** Key identifying the (base, sides) combination, ignoring spelling, prefix and number */
	FString GetSymmetryKey() const;

	static bool AreSiblings(const FRigExSymmetryName& A, const FRigExSymmetryName& B);
	static bool AreSiblings(const FName A, const FName B) { return AreSiblings(Parse(A), Parse(B)); }

	bool operator==(const FRigExSymmetryName& Other) const
	{
		return Base == Other.Base && TopBottom == Other.TopBottom && LeftRight == Other.LeftRight;
	}
};
