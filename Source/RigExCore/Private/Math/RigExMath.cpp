// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Math/RigExMath.h"

namespace RigExMath
{
	FQuat AverageRotations(const TArray<FQuat>& InRotations)
	{
		if (InRotations.IsEmpty()) { return FQuat::Identity; }

		FQuat Sum(0, 0, 0, 0);
		for (const FQuat& Rotation : InRotations)
		{
			const FQuat C = Canonicalize(Rotation.GetNormalized());
			Sum.X += C.X;
			Sum.Y += C.Y;
			Sum.Z += C.Z;
			Sum.W += C.W;
		}

		// Opposite rotations cancel out, keep the first canonical one then
		if (Sum.SizeSquared() <= SMALL_NUMBER) { return Canonicalize(InRotations[0].GetNormalized()); }

		Sum.Normalize();
		return Sum;
	}

	FQuat MakeBoneRotation(const FVector& InHead, const FVector& InTail, const double InRoll)
	{
		const FVector Dir = (InTail - InHead).GetSafeNormal();
		const FQuat Align = Dir.IsNearlyZero() ? FQuat::Identity : FQuat::FindBetweenNormals(BoneAxis, Dir);
		return Align * FQuat(BoneAxis, InRoll);
	}

	double GetRollFromRotation(const FQuat& InRotation)
	{
		const FVector Dir = InRotation.RotateVector(BoneAxis);
		const FQuat Align = FQuat::FindBetweenNormals(BoneAxis, Dir);
		const FQuat Roll = Align.Inverse() * InRotation;

		FQuat Swing;
		FQuat Twist;
		Roll.ToSwingTwist(BoneAxis, Swing, Twist);
		return Twist.GetTwistAngle(BoneAxis);
	}

	double GetJointAngle(const FVector& A, const FVector& Joint, const FVector& B)
	{
		const FVector In = (Joint - A).GetSafeNormal();
		const FVector Out = (B - Joint).GetSafeNormal();
		if (In.IsNearlyZero() || Out.IsNearlyZero()) { return 180; }

		const double Dot = FMath::Clamp(FVector::DotProduct(In, Out), -1.0, 1.0);
		return 180 - FMath::RadiansToDegrees(FMath::Acos(Dot));
	}

	FQuat ComputeChainOrientation(const FVector& FirstHead, const FVector& FirstTail, const FVector& LastHead, const FVector& LastTail, const FQuat& FirstRotation)
	{
		FVector YAxis = LastTail - FirstHead;

		if (YAxis.Size() < 1e-4) { YAxis = (LastHead - FirstTail).GetSafeNormal(); }
		else { YAxis.Normalize(); }

		if (YAxis.IsNearlyZero()) { return FirstRotation; }

		const FVector FirstY = FirstRotation.GetAxisY();
		FVector XAxis = FVector::CrossProduct(FirstY, YAxis);

		FVector ZAxis;
		if (XAxis.Size() < 1e-4)
		{
			ZAxis = FVector::CrossProduct(FirstRotation.GetAxisX(), YAxis).GetSafeNormal();
			XAxis = FVector::CrossProduct(YAxis, ZAxis);
		}
		else
		{
			XAxis.Normalize();
			ZAxis = FVector::CrossProduct(XAxis, YAxis);
		}

		return FMatrix(XAxis, YAxis, ZAxis, FVector::ZeroVector).ToQuat();
	}
}
