// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "RigExTest.h"

#include "RigExCore.h"

#define LOCTEXT_NAMESPACE "FRigExTestModule"

void FRigExTestModule::StartupModule()
{
	// Tests are auto-discovered by the automation framework
	UE_LOG(LogRigEx, Log, TEXT("RigExTest module loaded"));
}

void FRigExTestModule::ShutdownModule()
{
}

#undef LOCTEXT_NAMESPACE

IMPLEMENT_MODULE(FRigExTestModule, RigExTest)
