// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

namespace RigExFalloff
{
	/** Exponent value (or lower) that disables propagation from a chain end */
	constexpr double DisabledExponent = -10;

	FORCEINLINE static bool IsEnabled(const double Exponent) { return Exponent > DisabledExponent; }

	/**
	 * Influence weight of a driving chain end.
	 * @param Distance normalized distance from the influencing end, clamped to [0,1]
	 * @param Exponent 0 is linear, higher widens the influence
	 * @param bSpherical circle-shaped curve instead of a parabola
	 * @return unset if the exponent is the disabled sentinel
	 */
	RIGEXCORE_API TOptional<double> Weight(const double Distance, const double Exponent, const bool bSpherical);
}

/** Per chain-end falloff parameters */
struct RIGEXCORE_API FRigExFalloffSpec
{
	double Exponent = 0;
	bool bSpherical = false;

	FRigExFalloffSpec() = default;

	FRigExFalloffSpec(const double InExponent, const bool InSpherical)
		: Exponent(InExponent), bSpherical(InSpherical)
	{
	}

	bool IsEnabled() const { return RigExFalloff::IsEnabled(Exponent); }
};

/**
 * Stateless apart from an invocation counter, so a chain's number of weight
 * requests can be inspected after a build.
 */
class RIGEXCORE_API FRigExFalloffEvaluator
{
	mutable int32 NumEvaluations = 0;

public:
	FRigExFalloffEvaluator() = default;

	TOptional<double> Evaluate(const double Distance, const FRigExFalloffSpec& Spec) const;

	/** Influence at a chain factor, where the driver sits at factor 1 */
	TOptional<double> EvaluateFactor(const double Factor, const FRigExFalloffSpec& Spec) const { return Evaluate(1 - Factor, Spec); }

	int32 GetNumEvaluations() const { return NumEvaluations; }
	void ResetCounter() const { NumEvaluations = 0; }
};

/**
 * Normalized position of chain points between the chain start (0) and end (1),
 * either along the accumulated bone lengths or projected on the start-end axis.
 */
struct RIGEXCORE_API FRigExChainProjection
{
	bool bAlongCurve = false;

	TArray<double> ChainLengths;

	FVector Base = FVector::ZeroVector;
	FVector Axis = FVector::UpVector;
	double AxisLength = 0;

	FRigExChainProjection() = default;

	/**
	 * @param InPoints bone heads followed by the last bone tail
	 */
	FRigExChainProjection(const TArray<FVector>& InPoints, const bool InAlongCurve);

	double GetTotalLength() const { return ChainLengths.IsEmpty() ? 0 : ChainLengths.Last(); }

	double GetFactor(const FVector& InPosition, const int32 InIndex) const;

	/** Remap a chain factor to the section on one side of a middle pivot */
	static double GetPivotFactor(const double InFactor, const double InPivotFactor, const bool bBeforePivot);
};
