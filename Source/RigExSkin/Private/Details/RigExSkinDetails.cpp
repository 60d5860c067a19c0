// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Details/RigExSkinDetails.h"

#include "RigExSkinSettingsCache.h"
#include "Details/RigExParams.h"

#pragma region FRigExChainDetails

FRigExChainDetails::FRigExChainDetails()
	: BBoneSegments(RIGEX_SKIN_SETTINGS.GetDefaultBBoneSegments()),
	  SharpenThreshold(RIGEX_SKIN_SETTINGS.DefaultSharpenThreshold)
{
}

void FRigExChainDetails::Read(const FRigExParamReader& InReader)
{
	InReader.Read(RigExSkin::Params::BBones, BBoneSegments);
	InReader.Read(RigExSkin::Params::ChainPriority, Priority);
	InReader.Read(RigExSkin::Params::ConnectMirror, bConnectMirror);
	InReader.Read(RigExSkin::Params::ConnectEnds, bConnectEnds);
	InReader.Read(RigExSkin::Params::Sharpen, SharpenThreshold);
	InReader.Read(RigExSkin::Params::RotationIndex, RotationIndex);
	InReader.Read(RigExSkin::Params::MergeParentRotationAndScale, bMergeParentRotationAndScale);
}

bool FRigExChainDetails::Validate(const FRigExParamReader& InReader) const
{
	bool bValid = true;

	if (BBoneSegments < 1)
	{
		InReader.Fail(FString::Printf(TEXT("B-Bone segments must be at least 1, got %d"), BBoneSegments));
		bValid = false;
	}

	if (SharpenThreshold < 0 || SharpenThreshold > 180)
	{
		InReader.Fail(FString::Printf(TEXT("Sharpen threshold must be within [0, 180] degrees, got %f"), SharpenThreshold));
		bValid = false;
	}

	if (RotationIndex < 0)
	{
		InReader.Fail(FString::Printf(TEXT("Control rotation index can't be negative, got %d"), RotationIndex));
		bValid = false;
	}

	return bValid;
}

#pragma endregion

#pragma region FRigExFalloffDetails

void FRigExFalloffDetails::Read(const FRigExParamReader& InReader)
{
	TArray<double> Exponents = {Start.Exponent, Middle.Exponent, End.Exponent};
	InReader.Read(RigExSkin::Params::Falloff, Exponents, 3);

	TArray<bool> Spherical = {Start.bSpherical, Middle.bSpherical, End.bSpherical};
	InReader.Read(RigExSkin::Params::FalloffSpherical, Spherical, 3);

	if (Exponents.Num() == 3 && Spherical.Num() == 3)
	{
		Start = FRigExFalloffSpec(Exponents[0], Spherical[0]);
		Middle = FRigExFalloffSpec(Exponents[1], Spherical[1]);
		End = FRigExFalloffSpec(Exponents[2], Spherical[2]);
	}

	InReader.Read(RigExSkin::Params::FalloffLength, bAlongCurve);
}

bool FRigExFalloffDetails::Validate(const FRigExParamReader& InReader) const
{
	const double Exponents[3] = {Start.Exponent, Middle.Exponent, End.Exponent};
	for (const double Exponent : Exponents)
	{
		if (Exponent < RigExFalloff::DisabledExponent)
		{
			InReader.Fail(FString::Printf(TEXT("Falloff exponent %f is below the disabled value %f"), Exponent, RigExFalloff::DisabledExponent));
			return false;
		}
	}
	return true;
}

#pragma endregion

#pragma region FRigExStretchyDetails

void FRigExStretchyDetails::Read(const FRigExParamReader& InReader)
{
	InReader.Read(RigExSkin::Params::PivotPos, PivotPos);
	Falloff.Read(InReader);
	InReader.Read(RigExSkin::Params::FalloffTwist, bPropagateTwist);
	InReader.Read(RigExSkin::Params::FalloffScale, bPropagateScale);
	InReader.Read(RigExSkin::Params::FalloffToControls, bPropagateToControls);
}

bool FRigExStretchyDetails::Validate(const FRigExParamReader& InReader, const int32 InNumOrgs) const
{
	if (InNumOrgs < 2)
	{
		InReader.Fail(FString::Printf(TEXT("Input to rig type must be a chain of 2 or more bones, got %d"), InNumOrgs));
		return false;
	}

	if (PivotPos < 0 || PivotPos >= InNumOrgs)
	{
		InReader.Fail(FString::Printf(TEXT("Invalid middle control position: %d"), PivotPos));
		return false;
	}

	return Falloff.Validate(InReader);
}

#pragma endregion

#pragma region FRigExAnchorDetails

void FRigExAnchorDetails::Read(const FRigExParamReader& InReader)
{
	InReader.Read(RigExSkin::Params::MakeDeform, bMakeDeform);
	InReader.Read(RigExSkin::Params::AnchorHide, bHideUnlessMerged);
	InReader.Read(RigExSkin::Params::RotationIndex, RotationIndex);
	InReader.Read(RigExSkin::Params::MergeParentRotationAndScale, bMergeParentRotationAndScale);
}

bool FRigExAnchorDetails::Validate(const FRigExParamReader& InReader) const
{
	if (RotationIndex < 0)
	{
		InReader.Fail(FString::Printf(TEXT("Control rotation index can't be negative, got %d"), RotationIndex));
		return false;
	}
	return true;
}

#pragma endregion

#pragma region FRigExGlueDetails

void FRigExGlueDetails::Read(const FRigExParamReader& InReader)
{
	FString Mode = TEXT("CHILD");
	InReader.ReadEnum(RigExSkin::Params::GlueHeadMode, {TEXT("CHILD"), TEXT("MIRROR"), TEXT("REPARENT")}, Mode);

	if (Mode == TEXT("MIRROR")) { HeadMode = ERigExGlueHeadMode::Mirror; }
	else if (Mode == TEXT("REPARENT")) { HeadMode = ERigExGlueHeadMode::Reparent; }
	else { HeadMode = ERigExGlueHeadMode::Child; }

	InReader.Read(RigExSkin::Params::RelinkConstraints, bRelinkConstraints);
	InReader.Read(RigExSkin::Params::GlueUseTail, bUseTail);
	InReader.Read(RigExSkin::Params::GlueTailReparent, bTailReparent);
}

#pragma endregion
