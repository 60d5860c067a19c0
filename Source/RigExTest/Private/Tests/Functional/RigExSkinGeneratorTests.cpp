// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Misc/AutomationTest.h"
#include "RigExCoreSettingsCache.h"
#include "Chains/RigExChainBuilder.h"
#include "Core/RigExLog.h"
#include "Core/RigExSkinContext.h"
#include "Generator/RigExSkinGenerator.h"
#include "Helpers/RigExTestHelpers.h"
#include "Rigs/RigExAnchorRig.h"
#include "Rigs/RigExChainRig.h"
#include "Rigs/RigExGlueRig.h"
#include "Rigs/RigExStretchyChainRig.h"

#if WITH_DEV_AUTOMATION_TESTS

using RigExTest::FMetarigBuilder;

namespace RigExGeneratorTests
{
	/** Head bone plus a three bone lip chain along X, parented to it */
	static FMetarigBuilder MakeLipMetarig(const FName InChainType = RigExSkin::TypeBasicChain)
	{
		FMetarigBuilder Builder;
		Builder.Bone(FName("head"), FVector(0, 0, -1), FVector(0, 0, 0))
		       .Chain(TEXT("lip"), TEXT("L"), {FVector(1, 0, 0), FVector(2, 0, 0), FVector(3, 0, 0), FVector(4, 0, 0)}, FName("head"))
		       .Tag(FName("lip.001.L"), InChainType);
		return Builder;
	}

	/** Runs the generator and checks it failed cleanly */
	static void ExpectFailure(FAutomationTestBase& Test, const TSharedRef<FRigExArmature>& InMetarig, const TCHAR* InWhat)
	{
		FRigExSkinGenerator Generator(InMetarig);
		TSharedPtr<FRigExArmature> Rig;

		Test.TestFalse(*FString::Printf(TEXT("%s: generation fails"), InWhat), Generator.Generate(Rig));
		Test.TestFalse(*FString::Printf(TEXT("%s: no rig"), InWhat), Rig.IsValid());
		Test.TestTrue(*FString::Printf(TEXT("%s: errors reported"), InWhat), Generator.GetReport().HasErrors());
		Test.TestTrue(*FString::Printf(TEXT("%s: failed stage"), InWhat), Generator.GetStage() == ERigExSkinStage::Failed);
	}
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExGeneratorBasicTest, "RigEx.Functional.Generator.BasicChainAndAnchor", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExGeneratorBasicTest::RunTest(const FString& Parameters)
{
	FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig();
	Builder.Bone(FName("corner.L"), FVector(4, 0, 0), FVector(4, 1, 0), FName("head"))
	       .Tag(FName("corner.L"), RigExSkin::TypeAnchor);

	const TSharedRef<FRigExArmature> Metarig = Builder.Build();
	const int32 NumMetaBones = Metarig->Num();

	FRigExSkinGenerator Generator(Metarig);
	TSharedPtr<FRigExArmature> Rig;

	TestTrue(TEXT("Generate"), Generator.Generate(Rig));
	TestTrue(TEXT("Rig set"), Rig.IsValid());
	TestTrue(TEXT("Done"), Generator.GetStage() == ERigExSkinStage::Done);
	TestFalse(TEXT("No errors"), Generator.GetReport().HasErrors());
	if (!Rig) { return false; }

	// Source untouched
	TestEqual(TEXT("Metarig bone count"), Metarig->Num(), NumMetaBones);
	TestNotNull(TEXT("Metarig names kept"), Metarig->Find(FName("lip.001.L")));
	TestEqual(TEXT("Metarig tags kept"), Metarig->GetChecked(FName("lip.001.L")).RigType, RigExSkin::TypeBasicChain);

	for (const FName Name : {
		     FName("ORG-head"), FName("ORG-lip.001.L"), FName("ORG-lip.003.L"), FName("ORG-corner.L"),
		     FName("DEF-lip.001.L"), FName("DEF-lip.003.L"), FName("DEF-corner.L"),
		     FName("lip.001.L"), FName("lip.002.L"), FName("lip.003.L"), FName("corner.L"),
		     FName("MCH-lip.001_handle.L"), FName("MCH-lip.003_end_handle.L")})
	{
		TestNotNull(*FString::Printf(TEXT("Bone %s"), *Name.ToString()), Rig->Find(Name));
	}

	TestNull(TEXT("Anchor took the chain end"), Rig->Find(FName("lip.003_end.L")));

	const FRigExBone& Deform = Rig->GetChecked(FName("DEF-lip.002.L"));
	TestTrue(TEXT("Deforms"), Deform.bDeform);
	TestEqual(TEXT("Segments"), Deform.BBoneSegments, 10);
	TestEqual(TEXT("Start handle"), Deform.HandleStart, FName("MCH-lip.002_handle.L"));
	TestEqual(TEXT("End handle"), Deform.HandleEnd, FName("MCH-lip.003_handle.L"));
	TestTrue(TEXT("Copies its org"), RigExTest::HasConstraint(*Rig, Deform.Name, ERigExConstraintKind::CopyTransforms, FName("ORG-lip.002.L")));

	TestFalse(TEXT("Orgs don't deform"), Rig->GetChecked(FName("ORG-lip.002.L")).bDeform);
	TestTrue(TEXT("Org stretches to the next control"), RigExTest::HasConstraint(*Rig, FName("ORG-lip.002.L"), ERigExConstraintKind::StretchTo, FName("lip.003.L")));
	TestTrue(TEXT("Last org stretches to the anchor"), RigExTest::HasConstraint(*Rig, FName("ORG-lip.003.L"), ERigExConstraintKind::StretchTo, FName("corner.L")));

	const FRigExAnchorRig* Anchor = static_cast<const FRigExAnchorRig*>(Generator.FindRig(FName("corner.L")));
	TestTrue(TEXT("Anchor deform"), Anchor && Anchor->GetDeformBone() == FName("DEF-corner.L"));
	TestTrue(TEXT("Anchor owns the shared node"), Anchor && Generator.GetContext().GetNode(Anchor->GetNode()).IsMerged());

	TestEqual(TEXT("Anchor org follows its control"), Rig->GetChecked(FName("ORG-corner.L")).Parent, FName("corner.L"));
	TestEqual(TEXT("Anchor deform follows its org"), Rig->GetChecked(FName("DEF-corner.L")).Parent, FName("ORG-corner.L"));

	const FRigExBone& Handle = Rig->GetChecked(FName("MCH-lip.001_handle.L"));
	TestEqual(TEXT("Handle at its node"), Handle.Head, FVector(1, 0, 0));
	TestTrue(TEXT("Handle tracks the next control"), RigExTest::HasConstraint(*Rig, Handle.Name, ERigExConstraintKind::DampedTrack, FName("lip.002.L")));

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExGeneratorBuildLogTest, "RigEx.Functional.Generator.BuildLog", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExGeneratorBuildLogTest::RunTest(const FString& Parameters)
{
	if (!RIGEX_CORE_SETTINGS.bAccumulateBuildLog)
	{
		AddInfo(TEXT("Build log accumulation disabled in config"));
		return true;
	}

	const ERigExLogVerbosity Previous = FRigExLog::GetVerbosity(ERigExLogCategory::Generator);
	FRigExLog::SetVerbosity(ERigExLogCategory::Generator, ERigExLogVerbosity::Info);

	FString BuildLog;
	FString NestedLog;
	{
		FRigExSkinGenerator Generator(RigExGeneratorTests::MakeLipMetarig().Build());
		TSharedPtr<FRigExArmature> Rig;
		TestTrue(TEXT("Generate"), Generator.Generate(Rig));
		BuildLog = Generator.GetBuildLog();

		// A run inside an open capture leaves its messages to the outer one
		FRigExBuildLogScope Outer;
		FRigExSkinGenerator Nested(RigExGeneratorTests::MakeLipMetarig().Build());
		TSharedPtr<FRigExArmature> NestedRig;
		TestTrue(TEXT("Nested generate"), Nested.Generate(NestedRig));
		NestedLog = Nested.GetBuildLog();
		TestTrue(TEXT("Outer captured the nested run"), Outer.Release().Contains(TEXT("=== Generate Bones ===")));
	}

	FRigExLog::SetVerbosity(ERigExLogCategory::Generator, Previous);

	TestTrue(TEXT("Build stages logged"), BuildLog.Contains(TEXT("=== Generate Bones ===")));
	TestTrue(TEXT("Summary logged"), BuildLog.Contains(TEXT("[Generator][Info] Generated")));
	TestTrue(TEXT("Nested run has no log of its own"), NestedLog.IsEmpty());

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExGeneratorErrorsTest, "RigEx.Functional.Generator.ConfigurationErrors", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExGeneratorErrorsTest::RunTest(const FString& Parameters)
{
	{
		FMetarigBuilder Builder;
		Builder.Bone(FName("head"), FVector(0, 0, -1), FVector(0, 0, 0))
		       .Chain(TEXT("lip"), TEXT("L"), {FVector(0, 0, 0), FVector(0, 0, 2e-5), FVector(0, 0, 4e-5)}, FName("head"))
		       .Tag(FName("lip.001.L"), RigExSkin::TypeBasicChain);
		RigExGeneratorTests::ExpectFailure(*this, Builder.Build(), TEXT("Collapsed chain"));
	}

	{
		FMetarigBuilder Builder;
		Builder.Bone(FName("head"), FVector(0, 0, -1), FVector(0, 0, 0))
		       .Chain(TEXT("lip"), TEXT("L"), {FVector(1, 0, 0), FVector(2, 0, 0)}, FName("head"))
		       .Tag(FName("lip.001.L"), RigExSkin::TypeStretchyChain);
		RigExGeneratorTests::ExpectFailure(*this, Builder.Build(), TEXT("Single bone stretchy chain"));
	}

	{
		FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig(RigExSkin::TypeStretchyChain);
		Builder.Param(FName("lip.001.L"), RigExSkin::Params::PivotPos, TEXT("5"));
		RigExGeneratorTests::ExpectFailure(*this, Builder.Build(), TEXT("Pivot out of range"));
	}

	{
		FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig(FName("skin.unknown"));
		RigExGeneratorTests::ExpectFailure(*this, Builder.Build(), TEXT("Unknown rig type"));
	}

	{
		FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig();
		Builder.Param(FName("lip.001.L"), RigExSkin::Params::BBones, TEXT("many"));
		RigExGeneratorTests::ExpectFailure(*this, Builder.Build(), TEXT("Malformed parameter"));
	}

	{
		// Glue head with no control underneath
		FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig();
		Builder.Bone(FName("glue.L"), FVector(9, 0, 0), FVector(9, 0, 1), FName("head"))
		       .Tag(FName("glue.L"), RigExSkin::TypeGlue);
		RigExGeneratorTests::ExpectFailure(*this, Builder.Build(), TEXT("Unbound glue"));
	}

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExGeneratorStretchyTest, "RigEx.Functional.Generator.StretchyChain", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExGeneratorStretchyTest::RunTest(const FString& Parameters)
{
	{
		FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig(RigExSkin::TypeStretchyChain);
		Builder.Param(FName("lip.001.L"), RigExSkin::Params::BBones, TEXT("1"));

		FRigExSkinGenerator Generator(Builder.Build());
		TSharedPtr<FRigExArmature> Rig;
		TestTrue(TEXT("Single segment generates"), Generator.Generate(Rig));

		const FRigExStretchyChainRig* Stretchy = static_cast<const FRigExStretchyChainRig*>(Generator.FindRig(FName("lip.001.L")));
		TestNotNull(TEXT("Stretchy generator"), Stretchy);
		if (!Stretchy || !Rig) { return false; }

		TestEqual(TEXT("No falloff evaluated without handles"), Stretchy->GetEvaluator().GetNumEvaluations(), 0);
		TestNull(TEXT("No handles"), Rig->Find(FName("MCH-lip.001_handle.L")));
		TestEqual(TEXT("Single segment deform"), Rig->GetChecked(FName("DEF-lip.001.L")).BBoneSegments, 1);
	}

	{
		FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig(RigExSkin::TypeStretchyChain);
		Builder.Param(FName("lip.001.L"), RigExSkin::Params::PivotPos, TEXT("1"));
		Builder.Param(FName("lip.001.L"), RigExSkin::Params::FalloffScale, TEXT("true"));

		FRigExSkinGenerator Generator(Builder.Build());
		TSharedPtr<FRigExArmature> Rig;
		TestTrue(TEXT("Stretchy generates"), Generator.Generate(Rig));
		if (!Rig) { return false; }

		const FRigExStretchyChainRig* Stretchy = static_cast<const FRigExStretchyChainRig*>(Generator.FindRig(FName("lip.001.L")));
		TestTrue(TEXT("Falloff evaluated"), Stretchy && Stretchy->GetEvaluator().GetNumEvaluations() > 0);

		// Handles away from the ends and the pivot propagate the driver controls
		const FName Propagated = FName("MCH-lip.003_handle.L");
		TestNotNull(TEXT("Middle handle"), Rig->Find(Propagated));
		const FRigExBone& Handle = Rig->GetChecked(Propagated);
		const FRigExDriver* Twist = Handle.FindDriver(FName("rotation_euler"), 1);
		TestNotNull(TEXT("Twist driver"), Twist);
		if (Twist)
		{
			TestTrue(TEXT("Blends two handles"), Twist->Expression.StartsWith(TEXT("lerp(y1,y2,")));
			const FRigExDriverVariable* Var = Twist->FindVariable(FName("y2"));
			TestTrue(TEXT("Reads the end handle twist"), Var && Var->Bone == FName("MCH-lip.003_end_handle.L"));
		}

		TestEqual(TEXT("Two scale sources"), Handle.CountConstraints(ERigExConstraintKind::CopyScale), 2);
		TestNotNull(TEXT("Scale from start"), Handle.FindConstraint(FName("propagate_scale_start")));
		TestNotNull(TEXT("Scale from end"), Handle.FindConstraint(FName("propagate_scale_end")));

		TestNull(TEXT("Pivot handle drives itself"), Rig->GetChecked(FName("MCH-lip.002_handle.L")).FindConstraint(FName("propagate_scale_start")));
	}

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExGeneratorPropagateToControlsTest, "RigEx.Functional.Generator.PropagateToControls", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExGeneratorPropagateToControlsTest::RunTest(const FString& Parameters)
{
	// Merge flags left at their defaults
	FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig(RigExSkin::TypeStretchyChain);
	Builder.Param(FName("lip.001.L"), RigExSkin::Params::PivotPos, TEXT("2"));
	Builder.Param(FName("lip.001.L"), RigExSkin::Params::FalloffScale, TEXT("true"));
	Builder.Param(FName("lip.001.L"), RigExSkin::Params::FalloffToControls, TEXT("true"));

	FRigExSkinGenerator Generator(Builder.Build());
	TSharedPtr<FRigExArmature> Rig;
	TestTrue(TEXT("Generate"), Generator.Generate(Rig));
	if (!Rig) { return false; }

	const FRigExStretchyChainRig* Stretchy = static_cast<const FRigExStretchyChainRig*>(Generator.FindRig(FName("lip.001.L")));
	TestNotNull(TEXT("Stretchy generator"), Stretchy);
	if (!Stretchy) { return false; }

	const FRigExControlNode& Middle = Generator.GetContext().GetNode(Stretchy->GetNodes()[1]);
	TestFalse(TEXT("Location only offsets"), Middle.GetComposed().bMergeParentRotationAndScale);

	const FName Layer = FName("MCH-lip.002_handle_parent.L");
	TestNotNull(TEXT("Propagate layer bone"), Rig->Find(Layer));
	if (!Rig->Find(Layer)) { return false; }

	TestEqual(TEXT("Control follows the layer"), Rig->GetChecked(FName("lip.002.L")).Parent, Layer);
	TestEqual(TEXT("Layer sits on the offset"), Rig->GetChecked(Layer).Parent, FName("MCH-lip.002_offset.L"));

	const FRigExBone& Bone = Rig->GetChecked(Layer);
	const FRigExDriver* Twist = Bone.FindDriver(FName("rotation_euler"), 1);
	TestNotNull(TEXT("Layer twist driver"), Twist);
	if (Twist)
	{
		TestEqual(TEXT("Halfway to the pivot"), Twist->Expression, FString(TEXT("lerp(y1,y2,0.500000)")));
		const FRigExDriverVariable* Start = Twist->FindVariable(FName("y1"));
		const FRigExDriverVariable* Pivot = Twist->FindVariable(FName("y2"));
		TestTrue(TEXT("Reads the start handle"), Start && Start->Bone == FName("MCH-lip.001_handle.L"));
		TestTrue(TEXT("Reads the pivot handle"), Pivot && Pivot->Bone == FName("MCH-lip.003_handle.L"));
	}

	TestEqual(TEXT("Layer scale sources"), Bone.CountConstraints(ERigExConstraintKind::CopyScale), 2);
	TestNotNull(TEXT("Layer scale from start"), Bone.FindConstraint(FName("propagate_scale_start")));
	TestNotNull(TEXT("Layer scale from pivot"), Bone.FindConstraint(FName("propagate_scale_end")));

	TestNull(TEXT("No layer on the pivot"), Rig->Find(FName("MCH-lip.003_handle_parent.L")));
	TestNull(TEXT("No layer on the start"), Rig->Find(FName("MCH-lip.001_handle_parent.L")));
	TestNull(TEXT("No layer on the end"), Rig->Find(FName("MCH-lip.003_end_handle_parent.L")));

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExGeneratorGlueTest, "RigEx.Functional.Generator.GlueModes", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExGeneratorGlueTest::RunTest(const FString& Parameters)
{
	for (const TCHAR* Mode : {TEXT("CHILD"), TEXT("MIRROR"), TEXT("REPARENT")})
	{
		FMetarigBuilder Builder = RigExGeneratorTests::MakeLipMetarig();
		Builder.Bone(FName("glue.L"), FVector(2, 0, 0), FVector(2, 0, 1), FName("head"))
		       .Tag(FName("glue.L"), RigExSkin::TypeGlue)
		       .Param(FName("glue.L"), RigExSkin::Params::GlueHeadMode, Mode);

		FRigExSkinGenerator Generator(Builder.Build());
		TSharedPtr<FRigExArmature> Rig;
		TestTrue(*FString::Printf(TEXT("%s generates"), Mode), Generator.Generate(Rig));
		if (!Rig) { continue; }

		const FRigExGlueRig* Glue = static_cast<const FRigExGlueRig*>(Generator.FindRig(FName("glue.L")));
		if (!Glue)
		{
			AddError(*FString::Printf(TEXT("%s: glue generator missing"), Mode));
			continue;
		}

		const FRigExControlNode& Node = Generator.GetContext().GetNode(Glue->GetHeadQuery());
		const FRigExBone& Bone = Rig->GetChecked(FName("ORG-glue.L"));
		TestEqual(*FString::Printf(TEXT("%s: bound to the chain control"), Mode), Node.ControlBone, FName("lip.002.L"));

		if (FCString::Strcmp(Mode, TEXT("CHILD")) == 0)
		{
			TestEqual(TEXT("Child of the control"), Bone.Parent, Node.ControlBone);
			TestTrue(TEXT("No reparent bone"), Node.ReparentBone.IsNone());
		}
		else if (FCString::Strcmp(Mode, TEXT("MIRROR")) == 0)
		{
			TestEqual(TEXT("Sibling of the control"), Bone.Parent, Node.GetParentOutputBone());
			TestTrue(TEXT("Copies the control"), RigExTest::HasConstraint(*Rig, Bone.Name, ERigExConstraintKind::CopyTransforms, Node.ControlBone));
			TestEqual(TEXT("Placed on the control"), Bone.Head, Rig->GetChecked(Node.ControlBone).Head);
		}
		else
		{
			TestEqual(TEXT("Reparent bone"), Node.ReparentBone, FName("MCH-lip.002_reparent.L"));
			TestEqual(TEXT("Keeps its parent"), Bone.Parent, FName("ORG-head"));
			TestTrue(TEXT("Copies the reparent bone"), RigExTest::HasConstraint(*Rig, Bone.Name, ERigExConstraintKind::CopyTransforms, Node.ReparentBone));
		}
	}

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExGeneratorConnectedTest, "RigEx.Functional.Generator.ConnectedChains", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExGeneratorConnectedTest::RunTest(const FString& Parameters)
{
	FMetarigBuilder Builder;
	Builder.Bone(FName("head"), FVector(0, 0, -1), FVector(0, 0, 0))
	       .Chain(TEXT("upper"), TEXT("L"), {FVector(0, 0, 0), FVector(1, 0, 0), FVector(2, 0, 0)}, FName("head"))
	       .Chain(TEXT("lower"), TEXT("L"), {FVector(2, 0, 0), FVector(3, 0, 1), FVector(4, 0, 2)}, FName("head"))
	       .Tag(FName("upper.001.L"), RigExSkin::TypeBasicChain)
	       .Tag(FName("lower.001.L"), RigExSkin::TypeBasicChain)
	       .Param(FName("upper.001.L"), RigExSkin::Params::ConnectEnds, TEXT("true"))
	       .Param(FName("lower.001.L"), RigExSkin::Params::ConnectEnds, TEXT("true"))
	       .Param(FName("upper.001.L"), RigExSkin::Params::Sharpen, TEXT("150"))
	       .Param(FName("lower.001.L"), RigExSkin::Params::Sharpen, TEXT("150"));

	FRigExSkinGenerator Generator(Builder.Build());
	TSharedPtr<FRigExArmature> Rig;
	TestTrue(TEXT("Generate"), Generator.Generate(Rig));
	if (!Rig) { return false; }

	const FName Shared = FName("MCH-lower.001_handle.L");
	TestNotNull(TEXT("Next chain start handle"), Rig->Find(Shared));
	TestNull(TEXT("No end handle on the first chain"), Rig->Find(FName("MCH-upper.002_end_handle.L")));
	TestEqual(TEXT("Joint tangent is shared"), Rig->GetChecked(FName("DEF-upper.002.L")).HandleEnd, Shared);
	TestEqual(TEXT("Next chain starts there"), Rig->GetChecked(FName("DEF-lower.001.L")).HandleStart, Shared);

	const FRigExChainRig* Upper = static_cast<const FRigExChainRig*>(Generator.FindRig(FName("upper.001.L")));
	const FRigExChainRig* Lower = static_cast<const FRigExChainRig*>(Generator.FindRig(FName("lower.001.L")));
	if (!Upper || !Lower) { return false; }

	TestEqual(TEXT("Single joint control"), Generator.GetContext().GetNode(Upper->GetNodes().Last()).ControlBone, FName("lower.001.L"));

	const FRigExChainBuilder& UpperBuilder = *Upper->GetBuilder();
	const FRigExChainBuilder& LowerBuilder = *Lower->GetBuilder();
	TestTrue(TEXT("Linked to the next chain"), UpperBuilder.GetNextChain() == &LowerBuilder);
	TestEqual(TEXT("Own handles only"), UpperBuilder.GetHandles().Num(), 2);
	TestEqual(TEXT("Next chain keeps its handles"), LowerBuilder.GetHandles().Num(), 3);
	TestEqual(TEXT("Deforms"), UpperBuilder.GetDeformBones().Num(), 2);
	TestEqual(TEXT("Previous point of the next chain"), Generator.GetContext().GetEntry(LowerBuilder.GetPrevEntry()).Point, FVector(1, 0, 0));
	TestEqual(TEXT("Next point of the first chain"), Generator.GetContext().GetEntry(UpperBuilder.GetNextEntry()).Point, FVector(3, 0, 1));

	// 135 degree joint below a 150 degree threshold
	TestEqual(TEXT("Free start"), UpperBuilder.GetStartEase(), 1.0, RigExTest::Tolerance);
	TestEqual(TEXT("Sharpened end"), UpperBuilder.GetEndEase(), 0.9, RigExTest::Tolerance);
	TestEqual(TEXT("Sharpened start"), LowerBuilder.GetStartEase(), 0.9, RigExTest::Tolerance);
	TestEqual(TEXT("Applied to the deform ease"), Rig->GetChecked(FName("DEF-upper.002.L")).EaseOut, 0.9, RigExTest::Tolerance);

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExGeneratorMirrorConnectTest, "RigEx.Functional.Generator.MirrorConnect", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExGeneratorMirrorConnectTest::RunTest(const FString& Parameters)
{
	// Upper and lower lip meeting at the corner with a right angle
	FMetarigBuilder Builder;
	Builder.Bone(FName("head"), FVector(0, 0, -1), FVector(0, 0, 0))
	       .Chain(TEXT("lip"), TEXT("T.L"), {FVector(0, 0, 1), FVector(1, 0, 1), FVector(2, 0, 0)}, FName("head"))
	       .Chain(TEXT("lip"), TEXT("B.L"), {FVector(0, 0, -1), FVector(1, 0, -1), FVector(2, 0, 0)}, FName("head"))
	       .Tag(FName("lip.001.T.L"), RigExSkin::TypeBasicChain)
	       .Tag(FName("lip.001.B.L"), RigExSkin::TypeBasicChain)
	       .Param(FName("lip.001.T.L"), RigExSkin::Params::Sharpen, TEXT("150"))
	       .Param(FName("lip.001.B.L"), RigExSkin::Params::Sharpen, TEXT("150"));

	FRigExSkinGenerator Generator(Builder.Build());
	TSharedPtr<FRigExArmature> Rig;
	TestTrue(TEXT("Generate"), Generator.Generate(Rig));
	if (!Rig) { return false; }

	const FRigExChainRig* Top = static_cast<const FRigExChainRig*>(Generator.FindRig(FName("lip.001.T.L")));
	const FRigExChainRig* Bottom = static_cast<const FRigExChainRig*>(Generator.FindRig(FName("lip.001.B.L")));
	if (!Top || !Bottom)
	{
		AddError(TEXT("Chain generators missing"));
		return false;
	}

	const FRigExSkinContext& Context = Generator.GetContext();
	const FRigExControlNode& Corner = Context.GetNode(Top->GetNodes().Last());
	TestTrue(TEXT("Ends merged"), &Corner == &Context.GetNode(Bottom->GetNodes().Last()));
	TestEqual(TEXT("Top and bottom are a symmetry group"), Corner.GetSymmetryGroup().Num(), 2);
	TestEqual(TEXT("Single corner control"), Corner.ControlBone, FName("lip.002_end.B.L"));
	TestNull(TEXT("No second corner control"), Rig->Find(FName("lip.002_end.T.L")));

	const FRigExChainBuilder& TopBuilder = *Top->GetBuilder();
	const FRigExChainBuilder& BottomBuilder = *Bottom->GetBuilder();

	// Ends meet ends, so tangents are not shared
	TestTrue(TEXT("Top has no next chain"), TopBuilder.GetNextChain() == nullptr);
	TestTrue(TEXT("Bottom has no next chain"), BottomBuilder.GetNextChain() == nullptr);
	TestEqual(TEXT("Top handles"), TopBuilder.GetHandles().Num(), 3);
	TestEqual(TEXT("Bottom handles"), BottomBuilder.GetHandles().Num(), 3);

	TestTrue(TEXT("Top start unconnected"), TopBuilder.GetPrevEntry() == INDEX_NONE);
	TestTrue(TEXT("Top continues into the bottom lip"), TopBuilder.GetNextEntry() != INDEX_NONE && Context.GetEntry(TopBuilder.GetNextEntry()).Name == FName("lip.002.B.L"));
	TestTrue(TEXT("Bottom continues into the top lip"), BottomBuilder.GetNextEntry() != INDEX_NONE && Context.GetEntry(BottomBuilder.GetNextEntry()).Name == FName("lip.002.T.L"));

	const FName TopEnd = FName("MCH-lip.002_end_handle.T.L");
	const FName BottomEnd = FName("MCH-lip.002_end_handle.B.L");
	TestNotNull(TEXT("Top end handle"), Rig->Find(TopEnd));
	TestNotNull(TEXT("Bottom end handle"), Rig->Find(BottomEnd));
	TestTrue(TEXT("Top end handle tracks the bottom neighbor"), RigExTest::HasConstraint(*Rig, TopEnd, ERigExConstraintKind::DampedTrack, FName("lip.002.B.L")));
	TestTrue(TEXT("Bottom end handle tracks the top neighbor"), RigExTest::HasConstraint(*Rig, BottomEnd, ERigExConstraintKind::DampedTrack, FName("lip.002.T.L")));

	// 90 degree corner below a 150 degree threshold
	TestEqual(TEXT("Top free start"), TopBuilder.GetStartEase(), 1.0, RigExTest::Tolerance);
	TestEqual(TEXT("Top sharpened end"), TopBuilder.GetEndEase(), 0.6, RigExTest::Tolerance);
	TestEqual(TEXT("Bottom sharpened end"), BottomBuilder.GetEndEase(), 0.6, RigExTest::Tolerance);
	TestEqual(TEXT("Top deform ease"), Rig->GetChecked(FName("DEF-lip.002.T.L")).EaseOut, 0.6, RigExTest::Tolerance);
	TestEqual(TEXT("Bottom deform ease"), Rig->GetChecked(FName("DEF-lip.002.B.L")).EaseOut, 0.6, RigExTest::Tolerance);

	return true;
}

#endif
