// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Generator/RigExSkinGenerator.h"

#include "RigExCoreSettingsCache.h"
#include "RigExSkinSettingsCache.h"
#include "Core/RigExLog.h"
#include "Core/RigExSkinContext.h"
#include "Naming/RigExBoneNaming.h"
#include "Nodes/RigExNodeRegistry.h"
#include "Nodes/RigExOwnershipResolver.h"
#include "Parents/RigExNodeParents.h"
#include "Parents/RigExParentComposer.h"
#include "Rigs/RigExSkinRig.h"

FRigExSkinGenerator::FRigExSkinGenerator(const TSharedRef<FRigExArmature>& InMetarig)
	: Metarig(InMetarig)
{
}

FRigExSkinContext& FRigExSkinGenerator::GetContext() const
{
	checkf(Context, TEXT("Skin generator context accessed before initialization"));
	return *Context;
}

void FRigExSkinGenerator::SetStage(const ERigExSkinStage InStage)
{
	checkf(
		InStage == ERigExSkinStage::Failed || static_cast<uint8>(InStage) == static_cast<uint8>(Stage) + 1,
		TEXT("Invalid skin generation stage transition: %s -> %s"), RigExSkin::GetStageName(Stage), RigExSkin::GetStageName(InStage));

	Stage = InStage;
	if (Context) { Context->Stage = InStage; }
}

bool FRigExSkinGenerator::CheckErrors(const TCHAR* InStageName)
{
	if (!Report.HasErrors()) { return true; }

	RIGEX_LOG_ERROR(Generator, "%s failed with %d error(s)", InStageName, Report.GetNumErrors());
	for (const FRigExBuildMessage& Message : Report.GetMessages())
	{
		if (Message.Severity == ERigExBuildSeverity::Error) { RIGEX_LOG_ERROR(Generator, "  %s", *Message.ToString()); }
	}

	SetStage(ERigExSkinStage::Failed);
	return false;
}

bool FRigExSkinGenerator::Generate(TSharedPtr<FRigExArmature>& OutRig)
{
	checkf(Stage == ERigExSkinStage::None, TEXT("A skin generator can only run once"));

	// Nested generation runs leave the log to the outer one
	FRigExBuildLogScope LogScope(RIGEX_CORE_SETTINGS.bAccumulateBuildLog);

	const bool bSuccess = Run();

	if (LogScope.IsCapturing()) { BuildLog = LogScope.Release(); }

	if (bSuccess) { OutRig = Context->GetArmatureRef(); }
	return bSuccess;
}

bool FRigExSkinGenerator::Run()
{
	const double StartTime = FPlatformTime::Seconds();

	if (!InitializeRigs()) { return false; }
	if (!CollectNodes()) { return false; }
	if (!ResolveNodes()) { return false; }
	if (!ComposeNodes()) { return false; }
	if (!BuildBones()) { return false; }

	SetStage(ERigExSkinStage::Done);

	RIGEX_LOG_INFO(
		Generator, "Generated %d bones from %d generators and %d control nodes in %.2f ms, %d warning(s)",
		Context->GetArmature().Num(), Rigs.Num(), Context->GetRegistry().NumNodes(),
		(FPlatformTime::Seconds() - StartTime) * 1000.0, Report.GetNumWarnings());

	return true;
}

bool FRigExSkinGenerator::InitializeRigs()
{
	SetStage(ERigExSkinStage::Initialize);
	RIGEX_LOG_SECTION(Generator, "Initialize");

	const TSharedRef<FRigExArmature> Working = Metarig->Duplicate();

	Context = MakeShared<FRigExSkinContext>(Working, Report);
	Context->Metarig = &Metarig.Get();
	Context->MergeDomain = MergeDomain;
	Context->Stage = Stage;

	// Parents before children, then by name, so generators see their parent generator
	TArray<FName> Tagged;
	for (const FRigExBone& Bone : Metarig->GetBones())
	{
		if (Bone.HasRigType()) { Tagged.Add(Bone.Name); }
	}

	Tagged.Sort(
		[&](const FName A, const FName B)
		{
			const int32 DepthA = Metarig->GetDepth(A);
			const int32 DepthB = Metarig->GetDepth(B);
			if (DepthA != DepthB) { return DepthA < DepthB; }
			return A.Compare(B) < 0;
		});

	// Every metarig bone becomes an ORG bone of the generated rig
	TArray<FName> Names;
	for (const FRigExBone& Bone : Working->GetBones()) { Names.Add(Bone.Name); }

	for (const FName Name : Names)
	{
		const FName OrgName = RigExNaming::MakeOrgName(Name);
		if (OrgName != Name && !Working->RenameBone(Name, OrgName))
		{
			Report.AddError(Name, NAME_None, FString::Printf(TEXT("Cannot rename bone to %s"), *OrgName.ToString()));
			continue;
		}

		FRigExBone& Org = Working->GetChecked(OrgName);
		Org.bDeform = false;
		Org.RigType = NAME_None;
		Org.Params.Reset();
	}

	if (!CheckErrors(TEXT("Initialize"))) { return false; }

	for (const FName MetaBone : Tagged)
	{
		const FRigExBone& Bone = Metarig->GetChecked(MetaBone);

		ERigExSkinRigKind Kind;
		if (!RigExSkin::TryGetRigKind(Bone.RigType, Kind))
		{
			Report.AddError(MetaBone, Bone.RigType, FString::Printf(TEXT("Unknown rig type '%s'"), *Bone.RigType.ToString()));
			continue;
		}

		const TSharedPtr<FRigExSkinRig> Rig = RigExSkin::CreateRig(Kind);
		check(Rig);

		FRigExSkinRig* ParentRig = FindRig(Metarig->FindTaggedAncestor(MetaBone));
		Rig->Bind(MetaBone, RigExNaming::MakeOrgName(MetaBone), ParentRig, *Working);

		if (!Rig->Initialize(*Context, Bone))
		{
			RIGEX_LOG_WARNING(Generator, "%s (%s) failed to initialize", *MetaBone.ToString(), *Bone.RigType.ToString());
			continue;
		}

		Rigs.Add(Rig);
		RigsByBone.Add(MetaBone, Rig.Get());
	}

	RIGEX_LOG_INFO(Generator, "%d generators from %d tagged bones", Rigs.Num(), Tagged.Num());

	return CheckErrors(TEXT("Initialize"));
}

bool FRigExSkinGenerator::CollectNodes()
{
	SetStage(ERigExSkinStage::Collect);
	RIGEX_LOG_SECTION(Generator, "Collect");

	Context->Registry = MakeShared<FRigExNodeRegistry>(RIGEX_SKIN_SETTINGS.GetMergeTolerance());

	for (const TSharedPtr<FRigExSkinRig>& Rig : Rigs) { Rig->CollectNodes(*Context); }

	if (!Context->Registry->Freeze(Report)) { RIGEX_LOG_ERROR(Generator, "Some queries found no control node to bind to"); }

	return CheckErrors(TEXT("Collect"));
}

bool FRigExSkinGenerator::ResolveNodes()
{
	SetStage(ERigExSkinStage::Resolve);
	RIGEX_LOG_SECTION(Generator, "Resolve");

	Context->Resolver = MakeShared<FRigExOwnershipResolver>(Context->Registry.ToSharedRef());
	Context->Resolver->ResolveAll();

	bool bValid = true;
	for (const TSharedPtr<FRigExSkinRig>& Rig : Rigs)
	{
		if (!Rig->ValidateNodes(*Context)) { bValid = false; }
	}

	if (!bValid && !Report.HasErrors()) { Report.AddError(NAME_None, NAME_None, TEXT("Control node validation failed")); }

	return CheckErrors(TEXT("Resolve"));
}

bool FRigExSkinGenerator::ComposeNodes()
{
	SetStage(ERigExSkinStage::Compose);

	Context->Composer = MakeShared<FRigExParentComposer>(Context.ToSharedRef());
	Context->Composer->ComposeAll();

	CollectParents();

	return CheckErrors(TEXT("Compose"));
}

void FRigExSkinGenerator::CollectParents()
{
	Parents.Reset();
	TSet<const FRigExNodeParent*> Visited;

	TFunction<void(const TSharedPtr<FRigExNodeParent>&)> Visit = [&](const TSharedPtr<FRigExNodeParent>& InParent)
	{
		if (!InParent || Visited.Contains(InParent.Get())) { return; }
		Visited.Add(InParent.Get());

		if (InParent->GetKind() != ERigExNodeParentKind::Bone)
		{
			Visit(StaticCastSharedPtr<FRigExParentLayer>(InParent)->GetInner());
		}

		Parents.Add(InParent);
	};

	for (const TSharedPtr<FRigExControlNode>& Node : Context->GetRegistry().GetNodes())
	{
		for (const TSharedPtr<FRigExNodeParent>& Parent : Node->GetParentCache()) { Visit(Parent); }
	}

	RIGEX_LOG_VERBOSE(Generator, "%d parent mechanisms", Parents.Num());
}

bool FRigExSkinGenerator::BuildBones()
{
	SetStage(ERigExSkinStage::Build);

	const FRigExParentComposer& Composer = *Context->Composer;
	const TArray<TSharedPtr<FRigExControlNode>>& Nodes = Context->GetRegistry().GetNodes();

	RIGEX_LOG_SECTION(Generator, "Generate Bones");
	for (const TSharedPtr<FRigExControlNode>& Node : Nodes) { Composer.GenerateBones(*Node); }
	for (const TSharedPtr<FRigExSkinRig>& Rig : Rigs) { Rig->GenerateBones(*Context); }
	for (const TSharedPtr<FRigExNodeParent>& Parent : Parents) { Parent->GenerateBones(*Context); }
	if (!CheckErrors(TEXT("Generate Bones"))) { return false; }

	RIGEX_LOG_SECTION(Generator, "Parent Bones");
	for (const TSharedPtr<FRigExControlNode>& Node : Nodes) { Composer.ParentBones(*Node); }
	for (const TSharedPtr<FRigExSkinRig>& Rig : Rigs) { Rig->ParentBones(*Context); }
	for (const TSharedPtr<FRigExNodeParent>& Parent : Parents) { Parent->ParentBones(*Context); }
	if (!CheckErrors(TEXT("Parent Bones"))) { return false; }

	RIGEX_LOG_SECTION(Generator, "Rig Bones");
	for (const TSharedPtr<FRigExControlNode>& Node : Nodes) { Composer.RigBones(*Node); }
	for (const TSharedPtr<FRigExSkinRig>& Rig : Rigs) { Rig->RigBones(*Context); }
	for (const TSharedPtr<FRigExNodeParent>& Parent : Parents) { Parent->RigBones(*Context); }

	return CheckErrors(TEXT("Rig Bones"));
}
