// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "RigExModuleInterface.h"

#include "CoreMinimal.h"
#include "RigExCore.h"

TArray<IRigExModuleInterface*> IRigExModuleInterface::RegisteredModules;

void IRigExModuleInterface::StartupModule()
{
	UE_LOG(LogRigEx, Log, TEXT("IRigExModuleInterface::StartupModule >> %s"), *GetModuleName());
	RegisteredModules.AddUnique(this);
	UpdateSettingsCache();
}

void IRigExModuleInterface::ShutdownModule()
{
	RegisteredModules.Remove(this);
}

FString IRigExModuleInterface::GetSettingsSection() const
{
	const FString Name = GetModuleName();
	return FString::Printf(TEXT("/Script/%s.%sSettings"), *Name, *Name);
}

IRigExModuleInterface* IRigExModuleInterface::FindModule(const FString& InModuleName)
{
	for (IRigExModuleInterface* Module : RegisteredModules)
	{
		if (Module->GetModuleName().Equals(InModuleName, ESearchCase::IgnoreCase)) { return Module; }
	}
	return nullptr;
}

void IRigExModuleInterface::ReloadAllSettings()
{
	for (IRigExModuleInterface* Module : RegisteredModules)
	{
		UE_LOG(LogRigEx, Verbose, TEXT("Reloading %s from %s"), *Module->GetModuleName(), *Module->GetSettingsSection());
		Module->UpdateSettingsCache();
	}
}
