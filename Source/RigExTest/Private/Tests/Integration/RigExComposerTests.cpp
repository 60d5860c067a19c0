// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Misc/AutomationTest.h"
#include "Core/RigExSkinContext.h"
#include "Helpers/RigExTestHelpers.h"
#include "Nodes/RigExNodeRegistry.h"
#include "Parents/RigExNodeParents.h"

#if WITH_DEV_AUTOMATION_TESTS

using RigExTest::MakeEntry;

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExComposerAverageTest, "RigEx.Integration.Composer.SymmetricAverage", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExComposerAverageTest::RunTest(const FString& Parameters)
{
	RigExTest::FNodeFixture Fixture;

	FRigExNodeEntry Left = MakeEntry(FName("ORG-arm.L"), FName("arm.L"), 0, FVector(0, 0, 1), ERigExSkinRigKind::BasicChain, FName("shoulder.L"));
	Left.Rotation = FQuat(FVector::UpVector, FMath::DegreesToRadians(30.0));
	Left.Size = 2;

	FRigExNodeEntry Right = MakeEntry(FName("ORG-arm.R"), FName("arm.R"), 0, FVector(0, 0, 1), ERigExSkinRigKind::BasicChain, FName("shoulder.R"));
	Right.Rotation = FQuat(FVector::UpVector, FMath::DegreesToRadians(-30.0));
	Right.Size = 4;

	const FRigExNodeHandle Handle = Fixture.Register(Left);
	Fixture.Register(Right);

	TestTrue(TEXT("Freeze"), Fixture.Freeze());
	Fixture.Resolve();
	Fixture.Compose();

	FRigExControlNode& Node = Fixture.GetNode(Handle);
	const FRigExComposedNode& Composed = Node.GetComposed();

	TestEqual(TEXT("Group of two"), Node.GetSymmetryGroup().Num(), 2);
	TestTrue(TEXT("Opposite rotations cancel out"), Composed.GetRotation().AngularDistance(FQuat::Identity) < 1e-3);
	TestEqual(TEXT("Mean size"), Composed.Size, 3.0, RigExTest::Tolerance);
	TestEqual(TEXT("Owner position"), Composed.GetLocation(), FVector(0, 0, 1));
	TestEqual(TEXT("One parent per side"), Composed.Parents.Num(), 2);
	TestTrue(TEXT("Mixed parents inherit average scale"), Composed.InheritMode == ERigExInheritScale::Average);

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExComposerMixParentTest, "RigEx.Integration.Composer.MixParent", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExComposerMixParentTest::RunTest(const FString& Parameters)
{
	RigExTest::FNodeFixture Fixture;

	const FRigExNodeHandle Handle = Fixture.Register(MakeEntry(FName("ORG-arm.L"), FName("arm.L"), 0, FVector(0, 0, 1), ERigExSkinRigKind::BasicChain, FName("shoulder.L")));
	Fixture.Register(MakeEntry(FName("ORG-arm.R"), FName("arm.R"), 0, FVector(0, 0, 1), ERigExSkinRigKind::BasicChain, FName("shoulder.R")));

	TestTrue(TEXT("Freeze"), Fixture.Freeze());
	Fixture.Resolve();
	Fixture.Compose();
	Fixture.BuildNodeBones();

	const FRigExControlNode& Node = Fixture.GetNode(Handle);
	const FRigExArmature& Armature = *Fixture.Armature;

	TestEqual(TEXT("Control named after the owner"), Node.ControlBone, FName("arm.L"));
	TestEqual(TEXT("Mix parent bone"), Node.MixParentBone, FName("MCH-arm_mix_parent.L"));
	TestEqual(TEXT("Parent output"), Node.GetParentOutputBone(), Node.MixParentBone);
	TestEqual(TEXT("Control under mix parent"), Armature.GetChecked(Node.ControlBone).Parent, Node.MixParentBone);

	const FRigExConstraint* Mix = Armature.GetChecked(Node.MixParentBone).FindConstraint(FName("mix_parents"));
	TestNotNull(TEXT("Armature constraint"), Mix);
	if (!Mix) { return false; }

	TestTrue(TEXT("Armature kind"), Armature.GetChecked(Node.MixParentBone).FindConstraint(ERigExConstraintKind::Armature) == Mix);
	TestTrue(TEXT("Preserves volume"), Mix->bPreserveVolume);
	TestEqual(TEXT("Two targets"), Mix->Targets.Num(), 2);

	TArray<FName> Bones;
	for (const FRigExConstraintTarget& Target : Mix->Targets)
	{
		TestEqual(TEXT("Even weight"), Target.Weight, 0.5, RigExTest::Tolerance);
		Bones.Add(Target.Bone);
	}
	TestTrue(TEXT("Left parent"), Bones.Contains(FName("shoulder.L")));
	TestTrue(TEXT("Right parent"), Bones.Contains(FName("shoulder.R")));

	TestTrue(TEXT("No reparent"), Node.ReparentBone.IsNone());
	TestFalse(TEXT("Merged control shown"), Armature.GetChecked(Node.ControlBone).bHidden);

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExComposerSharedParentTest, "RigEx.Integration.Composer.SharedParent", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExComposerSharedParentTest::RunTest(const FString& Parameters)
{
	RigExTest::FNodeFixture Fixture;

	const FRigExNodeHandle Handle = Fixture.Register(MakeEntry(FName("ORG-brow.L"), FName("brow.L"), 0, FVector(1, 0, 0), ERigExSkinRigKind::BasicChain, FName("head")));
	Fixture.Register(MakeEntry(FName("ORG-brow.R"), FName("brow.R"), 0, FVector(1, 0, 0), ERigExSkinRigKind::BasicChain, FName("head")));

	TestTrue(TEXT("Freeze"), Fixture.Freeze());
	Fixture.Resolve();
	Fixture.Compose();
	Fixture.BuildNodeBones();

	const FRigExControlNode& Node = Fixture.GetNode(Handle);
	TestEqual(TEXT("Equal parents collapse"), Node.GetComposed().Parents.Num(), 1);
	TestTrue(TEXT("No mix parent"), Node.MixParentBone.IsNone());
	TestEqual(TEXT("Control under the shared parent"), Fixture.Armature->GetChecked(Node.ControlBone).Parent, FName("head"));

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExComposerReparentTest, "RigEx.Integration.Composer.Reparent", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExComposerReparentTest::RunTest(const FString& Parameters)
{
	RigExTest::FNodeFixture Fixture;

	FRigExNodeEntry Entry = MakeEntry(FName("ORG-jaw"), FName("jaw"), 0, FVector(0, 1, 0), ERigExSkinRigKind::BasicChain, FName("head"));
	Entry.bNeedsReparent = true;

	const FRigExNodeHandle Handle = Fixture.Register(Entry);
	TestTrue(TEXT("Freeze"), Fixture.Freeze());
	Fixture.Resolve();
	Fixture.Compose();
	Fixture.BuildNodeBones();

	const FRigExControlNode& Node = Fixture.GetNode(Handle);
	const FRigExArmature& Armature = *Fixture.Armature;

	TestTrue(TEXT("Composed with reparent"), Node.GetComposed().bNeedsReparent);
	TestEqual(TEXT("Reparent bone"), Node.ReparentBone, FName("MCH-jaw_reparent"));
	TestEqual(TEXT("Reparent under the parent output"), Armature.GetChecked(Node.ReparentBone).Parent, FName("head"));
	TestTrue(TEXT("Copies the control"), RigExTest::HasConstraint(Armature, Node.ReparentBone, ERigExConstraintKind::CopyTransforms, Node.ControlBone));

	if (const FRigExConstraint* Copy = Armature.GetChecked(Node.ReparentBone).FindConstraint(FName("copy_control")))
	{
		TestTrue(TEXT("Local space"), Copy->OwnerSpace == ERigExSpace::Local && Copy->TargetSpace == ERigExSpace::Local);
	}
	else
	{
		AddError(TEXT("copy_control missing"));
	}

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExComposerLoneControlTest, "RigEx.Integration.Composer.LoneControl", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExComposerLoneControlTest::RunTest(const FString& Parameters)
{
	RigExTest::FNodeFixture Fixture;

	FRigExNodeEntry Lone = MakeEntry(FName("ORG-nose"), FName("nose"), 0, FVector(0, 2, 0), ERigExSkinRigKind::Anchor, FName("head"));
	Lone.bHideLoneControl = true;

	FRigExNodeEntry Covered = MakeEntry(FName("ORG-chin"), FName("chin"), 0, FVector(0, 3, 0), ERigExSkinRigKind::Anchor, FName("head"));
	Covered.bHideLoneControl = true;

	const FRigExNodeHandle LoneHandle = Fixture.Register(Lone);
	const FRigExNodeHandle CoveredHandle = Fixture.Register(Covered);
	Fixture.Register(MakeEntry(FName("ORG-lip.B"), FName("lip.B"), 0, FVector(0, 3, 0), ERigExSkinRigKind::BasicChain, FName("head")));

	TestTrue(TEXT("Freeze"), Fixture.Freeze());
	Fixture.Resolve();
	Fixture.Compose();
	Fixture.BuildNodeBones();

	const FRigExControlNode& CoveredNode = Fixture.GetNode(CoveredHandle);
	TestEqual(TEXT("Anchor owns the merged node"), CoveredNode.ControlBone, FName("chin"));

	TestTrue(TEXT("Lone control hidden"), Fixture.Armature->GetChecked(Fixture.GetNode(LoneHandle).ControlBone).bHidden);
	TestFalse(TEXT("Merged control shown"), Fixture.Armature->GetChecked(CoveredNode.ControlBone).bHidden);

	return true;
}

#endif
