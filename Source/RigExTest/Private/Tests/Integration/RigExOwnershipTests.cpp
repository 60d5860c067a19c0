// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Misc/AutomationTest.h"
#include "Helpers/RigExTestHelpers.h"
#include "Nodes/RigExNodeRegistry.h"
#include "Nodes/RigExOwnershipResolver.h"

#if WITH_DEV_AUTOMATION_TESTS

using RigExTest::MakeEntry;

namespace RigExOwnershipTests
{
	/** Registers the entries at one point, resolves, returns the owner's name */
	static FName ResolveOwner(const TArray<FRigExNodeEntry>& InEntries, TSharedPtr<FRigExNodeRegistry>* OutRegistry = nullptr)
	{
		const TSharedRef<FRigExNodeRegistry> Registry = MakeShared<FRigExNodeRegistry>(1e-4);
		FRigExBuildReport Report;

		FRigExNodeHandle Handle;
		for (const FRigExNodeEntry& Entry : InEntries) { Handle = Registry->Register(Entry); }

		if (!Registry->Freeze(Report)) { return NAME_None; }
		FRigExOwnershipResolver(Registry).ResolveAll();

		if (OutRegistry) { *OutRegistry = Registry; }
		return Registry->GetEntry(Registry->GetNode(Handle)->GetOwner()).Name;
	}
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExOwnershipDepthTest, "RigEx.Integration.Ownership.Depth", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExOwnershipDepthTest::RunTest(const FString& Parameters)
{
	FRigExNodeEntry Shallow = MakeEntry(FName("ORG-zeta"), FName("zeta"), 0, FVector::ZeroVector);
	Shallow.ParentDepth = 1;

	FRigExNodeEntry Deep = MakeEntry(FName("ORG-alpha"), FName("alpha"), 0, FVector::ZeroVector);
	Deep.ParentDepth = 2;

	TestEqual(TEXT("Closer to the root wins over name"), RigExOwnershipTests::ResolveOwner({Deep, Shallow}), FName("zeta"));
	TestEqual(TEXT("Registration order does not matter"), RigExOwnershipTests::ResolveOwner({Shallow, Deep}), FName("zeta"));

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExOwnershipPriorityTest, "RigEx.Integration.Ownership.Priority", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExOwnershipPriorityTest::RunTest(const FString& Parameters)
{
	FRigExNodeEntry Shallow = MakeEntry(FName("ORG-a"), FName("a.L"), 0, FVector::ZeroVector);
	Shallow.ParentDepth = 0;

	FRigExNodeEntry Prioritized = MakeEntry(FName("ORG-b"), FName("b"), 0, FVector::ZeroVector);
	Prioritized.ParentDepth = 3;
	Prioritized.Priority = 10;

	TestEqual(TEXT("Priority beats depth and tags"), RigExOwnershipTests::ResolveOwner({Shallow, Prioritized}), FName("b"));

	FRigExNodeEntry Anchor = MakeEntry(FName("ORG-z"), FName("z"), 0, FVector::ZeroVector, ERigExSkinRigKind::Anchor);
	Anchor.ParentDepth = 5;

	TestEqual(TEXT("Anchor beats priority"), RigExOwnershipTests::ResolveOwner({Shallow, Prioritized, Anchor}), FName("z"));

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExOwnershipTieBreakTest, "RigEx.Integration.Ownership.TieBreak", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExOwnershipTieBreakTest::RunTest(const FString& Parameters)
{
	const FRigExNodeEntry Untagged = MakeEntry(FName("ORG-a"), FName("a"), 0, FVector::ZeroVector);
	const FRigExNodeEntry Tagged = MakeEntry(FName("ORG-b"), FName("b.L"), 0, FVector::ZeroVector);
	TestEqual(TEXT("Tagged first"), RigExOwnershipTests::ResolveOwner({Untagged, Tagged}), FName("b.L"));

	const FRigExNodeEntry First = MakeEntry(FName("ORG-a"), FName("a.L"), 0, FVector::ZeroVector);
	const FRigExNodeEntry Second = MakeEntry(FName("ORG-b"), FName("b.L"), 0, FVector::ZeroVector);
	TestEqual(TEXT("Chain name last"), RigExOwnershipTests::ResolveOwner({Second, First}), FName("a.L"));

	FRigExOwnershipRank RankA(First);
	FRigExOwnershipRank RankB(Second);
	TestTrue(TEXT("Strict order"), RankA < RankB && !(RankB < RankA));
	TestFalse(TEXT("Irreflexive"), RankA < RankA);
	TestTrue(TEXT("Equal to itself"), RankA == FRigExOwnershipRank(First));

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExOwnershipSymmetryTest, "RigEx.Integration.Ownership.SymmetryGroup", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExOwnershipSymmetryTest::RunTest(const FString& Parameters)
{
	const FRigExNodeEntry Left = MakeEntry(FName("ORG-lip.L"), FName("lip.L"), 0, FVector::ZeroVector);
	const FRigExNodeEntry Right = MakeEntry(FName("ORG-lip.R"), FName("lip.R"), 0, FVector::ZeroVector);
	const FRigExNodeEntry RightAgain = MakeEntry(FName("ORG-lip.R.001"), FName("lip_right"), 2, FVector::ZeroVector);
	const FRigExNodeEntry OtherKind = MakeEntry(FName("ORG-zz"), FName("lip.Back.L"), 0, FVector::ZeroVector, ERigExSkinRigKind::StretchyChain);
	const FRigExNodeEntry Unrelated = MakeEntry(FName("ORG-jaw"), FName("jaw"), 0, FVector::ZeroVector);

	TSharedPtr<FRigExNodeRegistry> Registry;
	TestEqual(TEXT("Owner"), RigExOwnershipTests::ResolveOwner({Unrelated, RightAgain, Right, OtherKind, Left}, &Registry), FName("lip.L"));
	if (!Registry) { return false; }

	const FRigExControlNode& Node = *Registry->GetNodes()[0];
	TestEqual(TEXT("All entries merged"), Node.GetEntries().Num(), 5);
	TestTrue(TEXT("Has group"), Node.HasSymmetryGroup());
	TestEqual(TEXT("Owner plus one sibling per tag set"), Node.GetSymmetryGroup().Num(), 2);

	TArray<FName> Members;
	for (const int32 Member : Node.GetSymmetryGroup()) { Members.Add(Registry->GetEntry(Member).Name); }
	TestTrue(TEXT("Owner in group"), Members.Contains(FName("lip.L")));
	TestTrue(TEXT("Best ranked right sibling"), Members.Contains(FName("lip.R")));
	TestFalse(TEXT("Different kind excluded"), Members.Contains(FName("lip.Back.L")));

	const FRigExOwnershipResolver Resolver(Registry.ToSharedRef());
	const int32 LeftIndex = Registry->GetEntry(Node.GetOwner()).Index;
	const int32 Mirror = Resolver.FindBestMirror(LeftIndex);
	TestTrue(TEXT("Mirror found"), Mirror != INDEX_NONE);
	if (Mirror != INDEX_NONE) { TestEqual(TEXT("Mirror is the right side"), Registry->GetEntry(Mirror).Name, FName("lip.R")); }

	return true;
}

#endif
