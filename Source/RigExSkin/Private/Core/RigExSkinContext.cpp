// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Core/RigExSkinContext.h"

#include "Core/RigExBuildReport.h"
#include "Core/RigExLog.h"
#include "Nodes/RigExNodeRegistry.h"
#include "Nodes/RigExOwnershipResolver.h"

FRigExSkinContext::FRigExSkinContext(const TSharedRef<FRigExArmature>& InArmature, FRigExBuildReport& InReport)
	: Armature(InArmature), Report(InReport)
{
}

bool FRigExSkinContext::HasErrors() const
{
	return Report.HasErrors();
}

FRigExNodeRegistry& FRigExSkinContext::GetRegistry() const
{
	checkf(Registry, TEXT("Control node registry accessed during stage %s"), RigExSkin::GetStageName(Stage));
	return *Registry;
}

const FRigExOwnershipResolver& FRigExSkinContext::GetResolver() const
{
	checkf(Resolver, TEXT("Ownership resolver accessed during stage %s"), RigExSkin::GetStageName(Stage));
	return *Resolver;
}

const FRigExNodeEntry& FRigExSkinContext::GetEntry(const int32 InEntry) const
{
	return GetRegistry().GetEntry(InEntry);
}

FRigExControlNode& FRigExSkinContext::GetNode(const FRigExNodeHandle InHandle) const
{
	return *GetRegistry().GetNode(InHandle);
}

FRigExControlNode& FRigExSkinContext::GetNodeOfEntry(const int32 InEntry) const
{
	return *GetRegistry().GetNode(FRigExNodeHandle(InEntry));
}

FRigExControlNode& FRigExSkinContext::GetNode(const FRigExQueryHandle InHandle) const
{
	return *GetRegistry().GetNode(InHandle);
}

FName FRigExSkinContext::CopyBone(const FName InSource, const FName InNewName, const bool bCopyBBone) const
{
	return Armature->CopyBone(InSource, InNewName, bCopyBBone);
}

void FRigExSkinContext::SetParent(const FName InChild, const FName InParent, const ERigExInheritScale InInheritScale, const bool bConnected) const
{
	Armature->SetParent(InChild, InParent, InInheritScale, bConnected);
}

FRigExConstraint& FRigExSkinContext::MakeConstraint(const FName InBone, const ERigExConstraintKind InKind, const FName InName, const FName InTarget) const
{
	RIGEX_LOG_VERBOSE(Generator, "%s: %s %s -> %s", *InBone.ToString(), FRigExConstraint::GetKindName(InKind), *InName.ToString(), *InTarget.ToString());
	return Armature->GetChecked(InBone).AddConstraint(InKind, InName, InTarget);
}

void FRigExSkinContext::AddError(const FName InBone, const ERigExSkinRigKind InKind, const FString& InText) const
{
	Report.AddError(InBone, RigExSkin::GetRigType(InKind), InText);
}

void FRigExSkinContext::AddWarning(const FName InBone, const ERigExSkinRigKind InKind, const FString& InText) const
{
	Report.AddWarning(InBone, RigExSkin::GetRigType(InKind), InText);
}
