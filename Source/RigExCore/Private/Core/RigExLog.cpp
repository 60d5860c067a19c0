// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Core/RigExLog.h"

DEFINE_LOG_CATEGORY_STATIC(LogRigExBuild, Log, All);

ERigExLogVerbosity FRigExLog::CategoryVerbosity[static_cast<uint8>(ERigExLogCategory::MAX)] = {
	ERigExLogVerbosity::Warning,
	ERigExLogVerbosity::Warning,
	ERigExLogVerbosity::Warning,
	ERigExLogVerbosity::Warning,
	ERigExLogVerbosity::Warning,
	ERigExLogVerbosity::Warning,
};
FRigExBuildLogScope* FRigExLog::ActiveScope = nullptr;
FCriticalSection FRigExLog::LogMutex;

static const TCHAR* GRigExCategoryNames[] = {
	TEXT("Registry"),
	TEXT("Ownership"),
	TEXT("Compose"),
	TEXT("Chain"),
	TEXT("Generator"),
	TEXT("Naming"),
};
static_assert(UE_ARRAY_COUNT(GRigExCategoryNames) == static_cast<uint8>(ERigExLogCategory::MAX), "Category names must match enum count");

static const TCHAR* GRigExVerbosityNames[] = {
	TEXT("Off"),
	TEXT("Error"),
	TEXT("Warning"),
	TEXT("Info"),
	TEXT("Verbose"),
};

const TCHAR* FRigExLog::GetCategoryName(ERigExLogCategory Category)
{
	const uint8 Index = static_cast<uint8>(Category);
	if (Index < UE_ARRAY_COUNT(GRigExCategoryNames)) { return GRigExCategoryNames[Index]; }
	return TEXT("Unknown");
}

const TCHAR* FRigExLog::GetVerbosityName(ERigExLogVerbosity Verbosity)
{
	const uint8 Index = static_cast<uint8>(Verbosity);
	if (Index < UE_ARRAY_COUNT(GRigExVerbosityNames)) { return GRigExVerbosityNames[Index]; }
	return TEXT("Unknown");
}

void FRigExLog::Log(ERigExLogCategory Category, ERigExLogVerbosity Verbosity, const FString& Message)
{
	if (!WouldLog(Category, Verbosity)) { return; }

	const FString FormattedMessage = FString::Printf(
		TEXT("[%s][%s] %s"),
		GetCategoryName(Category),
		GetVerbosityName(Verbosity),
		*Message);

	switch (Verbosity)
	{
	case ERigExLogVerbosity::Error:
		UE_LOG(LogRigExBuild, Error, TEXT("%s"), *FormattedMessage);
		break;
	case ERigExLogVerbosity::Warning:
		UE_LOG(LogRigExBuild, Warning, TEXT("%s"), *FormattedMessage);
		break;
	case ERigExLogVerbosity::Info:
	case ERigExLogVerbosity::Verbose:
		UE_LOG(LogRigExBuild, Log, TEXT("%s"), *FormattedMessage);
		break;
	default:
		break;
	}

	FScopeLock Lock(&LogMutex);
	if (ActiveScope) { ActiveScope->Lines.Add(FormattedMessage); }
}

void FRigExLog::SetVerbosity(ERigExLogCategory Category, ERigExLogVerbosity Verbosity)
{
	const uint8 CategoryIndex = static_cast<uint8>(Category);
	if (CategoryIndex >= static_cast<uint8>(ERigExLogCategory::MAX)) { return; }

	CategoryVerbosity[CategoryIndex] = Verbosity;
	UE_LOG(LogRigExBuild, Log, TEXT("RigEx log verbosity for '%s' set to '%s'"), GetCategoryName(Category), GetVerbosityName(Verbosity));
}

ERigExLogVerbosity FRigExLog::GetVerbosity(ERigExLogCategory Category)
{
	const uint8 CategoryIndex = static_cast<uint8>(Category);
	if (CategoryIndex < static_cast<uint8>(ERigExLogCategory::MAX)) { return CategoryVerbosity[CategoryIndex]; }
	return ERigExLogVerbosity::Off;
}

void FRigExLog::SetAllVerbosity(ERigExLogVerbosity Verbosity)
{
	for (uint8 i = 0; i < static_cast<uint8>(ERigExLogCategory::MAX); ++i) { CategoryVerbosity[i] = Verbosity; }
	UE_LOG(LogRigExBuild, Log, TEXT("RigEx log verbosity for ALL categories set to '%s'"), GetVerbosityName(Verbosity));
}

bool FRigExLog::WouldLog(ERigExLogCategory Category, ERigExLogVerbosity Verbosity)
{
	const uint8 CategoryIndex = static_cast<uint8>(Category);
	if (CategoryIndex >= static_cast<uint8>(ERigExLogCategory::MAX)) { return false; }
	if (Verbosity == ERigExLogVerbosity::Off) { return false; }
	return static_cast<uint8>(Verbosity) <= static_cast<uint8>(CategoryVerbosity[CategoryIndex]);
}

#pragma region FRigExBuildLogScope

FRigExBuildLogScope::FRigExBuildLogScope(const bool bInEnabled)
{
	if (!bInEnabled) { return; }

	FScopeLock Lock(&FRigExLog::LogMutex);
	if (FRigExLog::ActiveScope) { return; }

	FRigExLog::ActiveScope = this;
	bCapturing = true;
}

FRigExBuildLogScope::~FRigExBuildLogScope()
{
	if (!bCapturing) { return; }

	FScopeLock Lock(&FRigExLog::LogMutex);
	if (FRigExLog::ActiveScope == this) { FRigExLog::ActiveScope = nullptr; }
}

int32 FRigExBuildLogScope::NumLines() const
{
	FScopeLock Lock(&FRigExLog::LogMutex);
	return Lines.Num();
}

FString FRigExBuildLogScope::Release()
{
	FScopeLock Lock(&FRigExLog::LogMutex);

	if (bCapturing && FRigExLog::ActiveScope == this) { FRigExLog::ActiveScope = nullptr; }
	bCapturing = false;

	FString Result = FString::Join(Lines, TEXT("\n"));
	Lines.Empty();
	return Result;
}

bool FRigExBuildLogScope::IsAnyActive()
{
	FScopeLock Lock(&FRigExLog::LogMutex);
	return FRigExLog::ActiveScope != nullptr;
}

#pragma endregion
