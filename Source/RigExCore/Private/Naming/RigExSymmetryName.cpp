// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Naming/RigExSymmetryName.h"

namespace RigExNaming
{
	bool IsTagSeparator(const TCHAR InChar)
	{
		return InChar == TEXT('.') || InChar == TEXT('_') || InChar == TEXT('-') || InChar == TEXT(' ');
	}

	const TArray<TPair<FString, FString>>& GetLeftRightTags()
	{
		// Longest spellings first so "Left" is never read as "t"
		static const TArray<TPair<FString, FString>> Tags = {
			{TEXT("Left"), TEXT("Right")},
			{TEXT("left"), TEXT("right")},
			{TEXT("LEFT"), TEXT("RIGHT")},
			{TEXT("L"), TEXT("R")},
			{TEXT("l"), TEXT("r")},
		};
		return Tags;
	}

	const TArray<TPair<FString, FString>>& GetTopBottomTags()
	{
		// Longest spellings first, Front/Back are accepted as extra vertical spellings
		static const TArray<TPair<FString, FString>> Tags = {
			{TEXT("Front"), TEXT("Back")},
			{TEXT("front"), TEXT("back")},
			{TEXT("FRONT"), TEXT("BACK")},
			{TEXT("Top"), TEXT("Bot")},
			{TEXT("top"), TEXT("bot")},
			{TEXT("TOP"), TEXT("BOT")},
			{TEXT("Fr"), TEXT("Bk")},
			{TEXT("T"), TEXT("B")},
		};
		return Tags;
	}

	const TArray<FString>& GetKnownPrefixes()
	{
		static const TArray<FString> Prefixes = {TEXT("ORG"), TEXT("DEF"), TEXT("MCH")};
		return Prefixes;
	}

	/** Strip a "<sep><tag>" suffix from InOutName, returns the side (+1 first tag, -1 second tag, 0 none) */
	static int8 StripTag(FString& InOutName, const TArray<TPair<FString, FString>>& InTags, FString& OutTag, TCHAR& OutSeparator)
	{
		for (const TPair<FString, FString>& Pair : InTags)
		{
			for (int8 Side = 1; Side >= -1; Side -= 2)
			{
				const FString& Tag = Side > 0 ? Pair.Key : Pair.Value;
				const int32 TagStart = InOutName.Len() - Tag.Len();

				// Need at least one base character plus the separator
				if (TagStart < 2) { continue; }
				if (!InOutName.EndsWith(Tag, ESearchCase::CaseSensitive)) { continue; }

				const TCHAR Separator = InOutName[TagStart - 1];
				if (!IsTagSeparator(Separator)) { continue; }

				OutTag = Tag;
				OutSeparator = Separator;
				InOutName.LeftInline(TagStart - 1);
				return Side;
			}
		}

		return 0;
	}

	static FString FindMirrorTag(const FString& InTag, const TArray<TPair<FString, FString>>& InTags)
	{
		for (const TPair<FString, FString>& Pair : InTags)
		{
			if (Pair.Key.Equals(InTag, ESearchCase::CaseSensitive)) { return Pair.Value; }
			if (Pair.Value.Equals(InTag, ESearchCase::CaseSensitive)) { return Pair.Key; }
		}
		return InTag;
	}
}

FRigExSymmetryName FRigExSymmetryName::Parse(const FString& InName)
{
	FRigExSymmetryName Result;
	FString Remainder = InName;

	// .NNN
	int32 DotIndex = INDEX_NONE;
	if (Remainder.FindLastChar(TEXT('.'), DotIndex) && DotIndex > 0 && DotIndex < Remainder.Len() - 1)
	{
		const FString Digits = Remainder.RightChop(DotIndex + 1);
		bool bAllDigits = true;
		for (const TCHAR C : Digits) { bAllDigits &= FChar::IsDigit(C); }
		if (bAllDigits)
		{
			Result.Number = Digits;
			Remainder.LeftInline(DotIndex);
		}
	}

	for (const FString& Prefix : RigExNaming::GetKnownPrefixes())
	{
		const FString Token = Prefix + TEXT("-");
		if (Remainder.Len() > Token.Len() && Remainder.StartsWith(Token, ESearchCase::CaseSensitive))
		{
			Result.Prefix = Prefix;
			Remainder.RightChopInline(Token.Len());
			break;
		}
	}

	Result.LeftRight = RigExNaming::StripTag(Remainder, RigExNaming::GetLeftRightTags(), Result.LeftRightTag, Result.LeftRightSeparator);
	Result.TopBottom = RigExNaming::StripTag(Remainder, RigExNaming::GetTopBottomTags(), Result.TopBottomTag, Result.TopBottomSeparator);

	Result.Base = MoveTemp(Remainder);
	return Result;
}

FString FRigExSymmetryName::ToString() const
{
	FString Result;

	if (!Prefix.IsEmpty())
	{
		Result += Prefix;
		Result += TEXT("-");
	}

	Result += Base;

	if (TopBottom != 0)
	{
		Result.AppendChar(TopBottomSeparator);
		Result += TopBottomTag;
	}

	if (LeftRight != 0)
	{
		Result.AppendChar(LeftRightSeparator);
		Result += LeftRightTag;
	}

	if (!Number.IsEmpty())
	{
		Result += TEXT(".");
		Result += Number;
	}

	return Result;
}

FRigExSymmetryName FRigExSymmetryName::Mirrored(const bool bFlipLeftRight, const bool bFlipTopBottom) const
{
	FRigExSymmetryName Result = *this;

	if (bFlipLeftRight && LeftRight != 0)
	{
		Result.LeftRight = -LeftRight;
		Result.LeftRightTag = RigExNaming::FindMirrorTag(LeftRightTag, RigExNaming::GetLeftRightTags());
	}

	if (bFlipTopBottom && TopBottom != 0)
	{
		Result.TopBottom = -TopBottom;
		Result.TopBottomTag = RigExNaming::FindMirrorTag(TopBottomTag, RigExNaming::GetTopBottomTags());
	}

	return Result;
}

FString FRigExSymmetryName::GetSymmetryKey() const
{
	return FString::Printf(TEXT("%s|%d|%d"), *Base, TopBottom, LeftRight);
}

bool FRigExSymmetryName::AreSiblings(const FRigExSymmetryName& A, const FRigExSymmetryName& B)
{
	if (!A.HasSymmetry() || !B.HasSymmetry()) { return false; }
	if (!A.Base.Equals(B.Base, ESearchCase::CaseSensitive)) { return false; }

	const bool bFlippedLR = A.LeftRight != 0 && A.LeftRight == -B.LeftRight;
	const bool bFlippedFB = A.TopBottom != 0 && A.TopBottom == -B.TopBottom;
	const bool bSameLR = A.LeftRight == B.LeftRight;
	const bool bSameFB = A.TopBottom == B.TopBottom;

	return (bFlippedLR && bSameFB) || (bFlippedFB && bSameLR) || (bFlippedLR && bFlippedFB);
}
