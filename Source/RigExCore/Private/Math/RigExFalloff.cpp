// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Math/RigExFalloff.h"

namespace RigExFalloff
{
	TOptional<double> Weight(const double Distance, const double Exponent, const bool bSpherical)
	{
		if (!IsEnabled(Exponent)) { return TOptional<double>(); }

		const double T = FMath::Clamp(Distance, 0.0, 1.0);

		if (!bSpherical) { return FMath::Clamp(1 - FMath::Pow(T, FMath::Pow(2.0, Exponent)), 0.0, 1.0); }

		if (Exponent >= 0)
		{
			const double P = FMath::Pow(2.0, Exponent);
			return FMath::Clamp(FMath::Pow(1 - FMath::Pow(T, P), 1 / P), 0.0, 1.0);
		}

		// Negative exponents mirror the circle so the curve hugs the far end instead
		const double P = FMath::Pow(2.0, -Exponent);
		return FMath::Clamp(1 - FMath::Pow(1 - FMath::Pow(1 - T, P), 1 / P), 0.0, 1.0);
	}
}

TOptional<double> FRigExFalloffEvaluator::Evaluate(const double Distance, const FRigExFalloffSpec& Spec) const
{
	NumEvaluations++;
	return RigExFalloff::Weight(Distance, Spec.Exponent, Spec.bSpherical);
}

FRigExChainProjection::FRigExChainProjection(const TArray<FVector>& InPoints, const bool InAlongCurve)
	: bAlongCurve(InAlongCurve)
{
	ChainLengths.SetNumUninitialized(InPoints.Num());

	double Length = 0;
	for (int i = 0; i < InPoints.Num(); i++)
	{
		if (i > 0) { Length += FVector::Dist(InPoints[i - 1], InPoints[i]); }
		ChainLengths[i] = Length;
	}

	if (InPoints.Num() >= 2)
	{
		Base = InPoints[0];
		const FVector Span = InPoints.Last() - Base;
		AxisLength = Span.Size();
		Axis = AxisLength > SMALL_NUMBER ? Span / AxisLength : FVector::UpVector;
	}
}

double FRigExChainProjection::GetFactor(const FVector& InPosition, const int32 InIndex) const
{
	if (bAlongCurve)
	{
		const double Total = GetTotalLength();
		if (Total <= SMALL_NUMBER || !ChainLengths.IsValidIndex(InIndex)) { return 0; }
		return ChainLengths[InIndex] / Total;
	}

	if (AxisLength <= SMALL_NUMBER) { return 0; }
	return FMath::Clamp(FVector::DotProduct(InPosition - Base, Axis) / AxisLength, 0.0, 1.0);
}

double FRigExChainProjection::GetPivotFactor(const double InFactor, const double InPivotFactor, const bool bBeforePivot)
{
	if (bBeforePivot) { return InPivotFactor > SMALL_NUMBER ? FMath::Clamp(InFactor / InPivotFactor, 0.0, 1.0) : 1; }
	return InPivotFactor < 1 - SMALL_NUMBER ? FMath::Clamp((1 - InFactor) / (1 - InPivotFactor), 0.0, 1.0) : 1;
}
