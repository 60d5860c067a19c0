// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

namespace RigExMath
{
	/** Bone local axis the bone points along */
	static const FVector BoneAxis = FVector(0, 1, 0);

	/** Flip a quaternion into the W >= 0 hemisphere; q and -q are the same rotation */
	FORCEINLINE static FQuat Canonicalize(const FQuat& InQuat)
	{
		return InQuat.W < 0 ? FQuat(-InQuat.X, -InQuat.Y, -InQuat.Z, -InQuat.W) : InQuat;
	}

	/**
	 * Symmetric rotation average: normalized sum of canonicalized quaternions.
	 * Result does not depend on input order.
	 */
	RIGEXCORE_API FQuat AverageRotations(const TArray<FQuat>& InRotations);

	/** Rotation taking the bone axis onto the head->tail direction, then rolled around it */
	RIGEXCORE_API FQuat MakeBoneRotation(const FVector& InHead, const FVector& InTail, const double InRoll);

	/** Roll that MakeBoneRotation would need to reproduce InRotation's secondary axes */
	RIGEXCORE_API double GetRollFromRotation(const FQuat& InRotation);

	/**
	 * Interior angle in degrees at a joint between the incoming segment (A->Joint)
	 * and the outgoing segment (Joint->B). 180 means straight, 0 means folded back.
	 */
	RIGEXCORE_API double GetJointAngle(const FVector& A, const FVector& Joint, const FVector& B);

	/**
	 * Orientation of a chain with the Y axis from first head to last tail and X
	 * perpendicular to the plane the bones lie in.
	 */
	RIGEXCORE_API FQuat ComputeChainOrientation(const FVector& FirstHead, const FVector& FirstTail, const FVector& LastHead, const FVector& LastTail, const FQuat& FirstRotation);
}
