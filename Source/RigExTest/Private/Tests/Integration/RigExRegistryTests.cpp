// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Misc/AutomationTest.h"
#include "Helpers/RigExTestHelpers.h"
#include "Nodes/RigExNodeRegistry.h"
#include "Nodes/RigExOwnershipResolver.h"

#if WITH_DEV_AUTOMATION_TESTS

using RigExTest::MakeEntry;

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExRegistryMergeTest, "RigEx.Integration.Registry.Merge", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExRegistryMergeTest::RunTest(const FString& Parameters)
{
	FRigExNodeRegistry Registry(1e-3);
	FRigExBuildReport Report;

	const FRigExNodeHandle A = Registry.Register(MakeEntry(FName("ORG-lip.T.L"), FName("lip.T.L"), 0, FVector(1, 0, 0)));
	const FRigExNodeHandle B = Registry.Register(MakeEntry(FName("ORG-lip.B.L"), FName("lip.B.L"), 0, FVector(1, 0, 0.0005)));
	const FRigExNodeHandle C = Registry.Register(MakeEntry(FName("ORG-lip.T.L"), FName("lip.T.L.001"), 1, FVector(2, 0, 0)));
	const FRigExNodeHandle D = Registry.Register(MakeEntry(FName("ORG-cheek"), FName("cheek"), 0, FVector(1, 0, 0.01)));

	TestFalse(TEXT("Not frozen yet"), Registry.IsFrozen());
	TestTrue(TEXT("Freeze"), Registry.Freeze(Report));
	TestTrue(TEXT("Frozen"), Registry.IsFrozen());

	TestEqual(TEXT("Entries"), Registry.NumEntries(), 4);
	TestEqual(TEXT("Nodes"), Registry.NumNodes(), 3);
	TestTrue(TEXT("Within tolerance merges"), Registry.GetNode(A) == Registry.GetNode(B));
	TestTrue(TEXT("Different point"), Registry.GetNode(A) != Registry.GetNode(C));
	TestTrue(TEXT("Outside tolerance"), Registry.GetNode(A) != Registry.GetNode(D));
	TestEqual(TEXT("Merged node entries"), Registry.GetNode(A)->GetEntries().Num(), 2);
	TestTrue(TEXT("Merged"), Registry.GetNode(A)->IsMerged());

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExRegistryIdempotenceTest, "RigEx.Integration.Registry.Idempotence", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExRegistryIdempotenceTest::RunTest(const FString& Parameters)
{
	FRigExNodeRegistry Registry(1e-4);
	FRigExBuildReport Report;

	const FRigExNodeEntry Entry = MakeEntry(FName("ORG-jaw"), FName("jaw"), 0, FVector(0, 1, 0));

	const FRigExNodeHandle First = Registry.Register(Entry);
	const FRigExNodeHandle Second = Registry.Register(Entry);

	// Same identity at another position is still the same registration
	FRigExNodeEntry Moved = Entry;
	Moved.Point = FVector(5, 5, 5);
	const FRigExNodeHandle Third = Registry.Register(Moved);

	TestTrue(TEXT("Same handle"), First == Second);
	TestTrue(TEXT("Same handle for moved"), First == Third);
	TestEqual(TEXT("Single entry"), Registry.NumEntries(), 1);

	TestTrue(TEXT("Freeze"), Registry.Freeze(Report));
	TestEqual(TEXT("Single node"), Registry.NumNodes(), 1);
	TestEqual(TEXT("Point of the first registration"), Registry.GetEntry(First).Point, FVector(0, 1, 0));

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExRegistryOrderTest, "RigEx.Integration.Registry.OrderIndependence", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExRegistryOrderTest::RunTest(const FString& Parameters)
{
	// A chain of points each just within tolerance of the next: merging must not depend on which comes first
	TArray<FRigExNodeEntry> Entries;
	Entries.Add(MakeEntry(FName("ORG-a"), FName("a"), 0, FVector(0, 0, 0)));
	Entries.Add(MakeEntry(FName("ORG-b"), FName("b.L"), 0, FVector(0.0008, 0, 0)));
	Entries.Add(MakeEntry(FName("ORG-c"), FName("c.R"), 0, FVector(0.0016, 0, 0)));
	Entries.Add(MakeEntry(FName("ORG-d"), FName("d"), 3, FVector(0, 0.0009, 0), ERigExSkinRigKind::StretchyChain));
	Entries.Add(MakeEntry(FName("ORG-e"), FName("e"), 0, FVector(3, 0, 0)));
	Entries[3].Priority = 2;

	auto Describe = [&](const TArray<int32>& InOrder)
	{
		const TSharedRef<FRigExNodeRegistry> Registry = MakeShared<FRigExNodeRegistry>(1e-3);
		FRigExBuildReport Report;

		TMap<FName, FRigExNodeHandle> Handles;
		for (const int32 i : InOrder) { Handles.Add(Entries[i].ChainName, Registry->Register(Entries[i])); }

		TestTrue(TEXT("Freeze"), Registry->Freeze(Report));
		FRigExOwnershipResolver(Registry).ResolveAll();

		// Node membership and owner, by name, for every entry
		TArray<FString> Lines;
		for (const FRigExNodeEntry& Entry : Entries)
		{
			const FRigExControlNode& Node = *Registry->GetNode(Handles[Entry.ChainName]);
			TArray<FString> Members;
			for (const int32 Member : Node.GetEntries()) { Members.Add(Registry->GetEntry(Member).Name.ToString()); }
			Lines.Add(FString::Printf(TEXT("%s -> [%s] owner %s"), *Entry.Name.ToString(), *FString::Join(Members, TEXT(",")), *Registry->GetEntry(Node.GetOwner()).Name.ToString()));
		}
		return FString::Join(Lines, TEXT("\n"));
	};

	const FString Reference = Describe({0, 1, 2, 3, 4});
	const TArray<TArray<int32>> Permutations = {{4, 3, 2, 1, 0}, {2, 0, 4, 1, 3}, {1, 3, 0, 4, 2}, {3, 4, 1, 2, 0}};

	for (const TArray<int32>& Order : Permutations)
	{
		TestEqual(TEXT("Same clusters and owners"), Describe(Order), Reference);
	}

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExRegistryAnchorTest, "RigEx.Integration.Registry.NonMergeable", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExRegistryAnchorTest::RunTest(const FString& Parameters)
{
	FRigExNodeRegistry Registry(1e-3);
	FRigExBuildReport Report;

	const FRigExNodeHandle AnchorA = Registry.Register(MakeEntry(FName("ORG-anchor.L"), FName("anchor.L"), 0, FVector::ZeroVector, ERigExSkinRigKind::Anchor));
	const FRigExNodeHandle AnchorB = Registry.Register(MakeEntry(FName("ORG-anchor.R"), FName("anchor.R"), 0, FVector::ZeroVector, ERigExSkinRigKind::Anchor));
	const FRigExNodeHandle Chain = Registry.Register(MakeEntry(FName("ORG-lip"), FName("lip"), 0, FVector::ZeroVector));

	// Different domain never merges
	FRigExNodeEntry Foreign = MakeEntry(FName("ORG-other"), FName("other"), 0, FVector::ZeroVector);
	Foreign.MergeDomain = FName("Elsewhere");
	const FRigExNodeHandle Other = Registry.Register(Foreign);

	TestTrue(TEXT("Freeze"), Registry.Freeze(Report));

	TestTrue(TEXT("Two anchors stay apart"), Registry.GetNode(AnchorA) != Registry.GetNode(AnchorB));
	TestEqual(TEXT("Chain merges into one anchor"), Registry.GetNode(Chain)->GetEntries().Num(), 2);
	TestTrue(
		TEXT("Chain merged with the first anchor by identity"),
		Registry.GetNode(Chain) == Registry.GetNode(AnchorA));
	TestEqual(TEXT("Foreign domain alone"), Registry.GetNode(Other)->GetEntries().Num(), 1);
	TestEqual(TEXT("Nodes"), Registry.NumNodes(), 3);

	return true;
}

IMPLEMENT_SIMPLE_AUTOMATION_TEST(FRigExRegistryQueryTest, "RigEx.Integration.Registry.Queries", EAutomationTestFlags::EditorContext | EAutomationTestFlags::EngineFilter)
bool FRigExRegistryQueryTest::RunTest(const FString& Parameters)
{
	{
		FRigExNodeRegistry Registry(1e-3);
		FRigExBuildReport Report;

		const FRigExNodeHandle Near = Registry.Register(MakeEntry(FName("ORG-a"), FName("a"), 0, FVector(0, 0, 0)));
		Registry.Register(MakeEntry(FName("ORG-b"), FName("b"), 0, FVector(0.0006, 0, 0)));

		FRigExQueryEntry Query;
		Query.Org = FName("ORG-glue");
		Query.Point = FVector(0.0001, 0, 0);
		Query.MergeDomain = FName("SkinControls");
		Query.bNeedsReparent = true;
		const FRigExQueryHandle Handle = Registry.RegisterQuery(Query);

		TestTrue(TEXT("Bound"), Registry.Freeze(Report));
		TestTrue(TEXT("Closest node"), Registry.GetNode(Handle) == Registry.GetNode(Near));
		TestTrue(TEXT("Node lists the query"), Registry.GetNode(Near)->GetQueries().Contains(Handle.Query));
		TestEqual(TEXT("Query does not add entries"), Registry.NumEntries(), 2);
	}

	{
		FRigExNodeRegistry Registry(1e-3);
		FRigExBuildReport Report;

		Registry.Register(MakeEntry(FName("ORG-a"), FName("a"), 0, FVector(0, 0, 0)));

		FRigExQueryEntry Query;
		Query.Org = FName("ORG-glue");
		Query.Point = FVector(1, 0, 0);
		Query.MergeDomain = FName("SkinControls");
		Registry.RegisterQuery(Query);

		TestFalse(TEXT("Unbound query fails"), Registry.Freeze(Report));
		TestNotNull(TEXT("Reported on the glue bone"), Report.Find(FName("ORG-glue"), ERigExBuildSeverity::Error));
	}

	return true;
}

#endif
