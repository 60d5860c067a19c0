// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Misc/AutomationTest.h"
#include "Chains/RigExChainBuilder.h"
#include "Math/RigExMath.h"

#if WITH_DEV_AUTOMATION_TESTS

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExJointAngleTest, "RigEx.Unit.ChainMath.JointAngle", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExJointAngleTest::RunTest(const FString& Parameters)
{
	const FVector Joint(1, 0, 0);

	TestEqual(TEXT("Straight"), RigExMath::GetJointAngle(FVector(0, 0, 0), Joint, FVector(2, 0, 0)), 180.0, 1e-3);
	TestEqual(TEXT("Right angle"), RigExMath::GetJointAngle(FVector(0, 0, 0), Joint, FVector(1, 1, 0)), 90.0, 1e-3);
	TestEqual(TEXT("Folded back"), RigExMath::GetJointAngle(FVector(0, 0, 0), Joint, FVector(0, 0, 0)), 0.0, 1e-3);

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExCornerEaseTest, "RigEx.Unit.ChainMath.CornerEase", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExCornerEaseTest::RunTest(const FString& Parameters)
{
	TestEqual(TEXT("Disabled threshold"), FRigExChainBuilder::ComputeCornerEase(30, 0), 1.0, KINDA_SMALL_NUMBER);
	TestEqual(TEXT("Above threshold"), FRigExChainBuilder::ComputeCornerEase(150, 90), 1.0, KINDA_SMALL_NUMBER);
	TestEqual(TEXT("At threshold"), FRigExChainBuilder::ComputeCornerEase(90, 90), 1.0, KINDA_SMALL_NUMBER);
	TestEqual(TEXT("Below threshold"), FRigExChainBuilder::ComputeCornerEase(45, 90), 0.5, KINDA_SMALL_NUMBER);
	TestEqual(TEXT("Folded"), FRigExChainBuilder::ComputeCornerEase(0, 90), 0.0, KINDA_SMALL_NUMBER);

	const double Sharper = FRigExChainBuilder::ComputeCornerEase(20, 90);
	const double Softer = FRigExChainBuilder::ComputeCornerEase(70, 90);
	TestTrue(TEXT("Sharper corner eases less"), Sharper < Softer);

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExAverageRotationsTest, "RigEx.Unit.ChainMath.AverageRotations", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExAverageRotationsTest::RunTest(const FString& Parameters)
{
	const FQuat A(FVector::UpVector, FMath::DegreesToRadians(30));
	const FQuat B(FVector::UpVector, FMath::DegreesToRadians(-30));
	const FQuat C(FVector::ForwardVector, FMath::DegreesToRadians(10));

	const FQuat AB = RigExMath::AverageRotations({A, B});
	TestTrue(TEXT("Mirrored pair averages to identity"), AB.Equals(FQuat::Identity, 1e-6));

	const FQuat ABC = RigExMath::AverageRotations({A, B, C});
	const FQuat CBA = RigExMath::AverageRotations({C, B, A});
	TestTrue(TEXT("Order independent"), ABC.Equals(CBA, 1e-9));

	// q and -q are the same rotation
	const FQuat Negated(-A.X, -A.Y, -A.Z, -A.W);
	TestTrue(TEXT("Sign independent"), RigExMath::AverageRotations({A, Negated}).Equals(RigExMath::Canonicalize(A), 1e-6));

	TestTrue(TEXT("Single"), RigExMath::AverageRotations({C}).Equals(RigExMath::Canonicalize(C), 1e-9));

	return true;
}

#endif
