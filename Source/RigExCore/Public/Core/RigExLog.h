// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

class FRigExBuildLogScope;

/**
 * Log categories for the rig generation stages.
 */
enum class ERigExLogCategory : uint8
{
	/** Control node registration and merging */
	Registry,
	/** Owner selection and symmetry groups */
	Ownership,
	/** Parent mechanisms and transform averaging */
	Compose,
	/** Chain handles, deform bones and propagation */
	Chain,
	/** Pipeline stages and per-rig setup */
	Generator,
	/** Name parsing and constraint relinking */
	Naming,

	MAX
};

enum class ERigExLogVerbosity : uint8
{
	Off = 0,
	Error,
	Warning,
	Info,
	Verbose
};

/**
 * Static categorized logger for skin rig generation.
 *
 * Usage:
 *   RIGEX_LOG(Registry, Info, "Merged %d entries into %d nodes", NumEntries, NumNodes);
 *
 * Messages are forwarded to UE_LOG, and to the active FRigExBuildLogScope if any.
 */
class RIGEXCORE_API FRigExLog
{
	friend class FRigExBuildLogScope;

public:
	/** Message is only output if category verbosity >= message verbosity. */
	static void Log(ERigExLogCategory Category, ERigExLogVerbosity Verbosity, const FString& Message);

	static void SetVerbosity(ERigExLogCategory Category, ERigExLogVerbosity Verbosity);
	static ERigExLogVerbosity GetVerbosity(ERigExLogCategory Category);
	static void SetAllVerbosity(ERigExLogVerbosity Verbosity);

	/** Check before formatting expensive messages */
	static bool WouldLog(ERigExLogCategory Category, ERigExLogVerbosity Verbosity);

	static const TCHAR* GetCategoryName(ERigExLogCategory Category);
	static const TCHAR* GetVerbosityName(ERigExLogVerbosity Verbosity);

private:
	static ERigExLogVerbosity CategoryVerbosity[static_cast<uint8>(ERigExLogCategory::MAX)];
	static FRigExBuildLogScope* ActiveScope;
	static FCriticalSection LogMutex;
};

/**
 * Collects every message logged while alive, so a generation run can hand back its own build log.
 * Only the outermost scope captures; a scope opened while another is active stays inert.
 */
class RIGEXCORE_API FRigExBuildLogScope
{
	friend class FRigExLog;

	TArray<FString> Lines;
	bool bCapturing = false;

public:
	explicit FRigExBuildLogScope(const bool bInEnabled = true);
	~FRigExBuildLogScope();

	FRigExBuildLogScope(const FRigExBuildLogScope&) = delete;
	FRigExBuildLogScope& operator=(const FRigExBuildLogScope&) = delete;

	bool IsCapturing() const { return bCapturing; }
	int32 NumLines() const;

	/** Stops capturing and returns the collected messages, one per line */
	FString Release();

	static bool IsAnyActive();
};

#define RIGEX_LOG(Category, Verbosity, Format, ...) \
	do { \
		if (FRigExLog::WouldLog(ERigExLogCategory::Category, ERigExLogVerbosity::Verbosity)) \
		{ \
			FRigExLog::Log(ERigExLogCategory::Category, ERigExLogVerbosity::Verbosity, FString::Printf(TEXT(Format), ##__VA_ARGS__)); \
		} \
	} while (0)

#define RIGEX_LOG_ERROR(Category, Format, ...) RIGEX_LOG(Category, Error, Format, ##__VA_ARGS__)
#define RIGEX_LOG_WARNING(Category, Format, ...) RIGEX_LOG(Category, Warning, Format, ##__VA_ARGS__)
#define RIGEX_LOG_INFO(Category, Format, ...) RIGEX_LOG(Category, Info, Format, ##__VA_ARGS__)
#define RIGEX_LOG_VERBOSE(Category, Format, ...) RIGEX_LOG(Category, Verbose, Format, ##__VA_ARGS__)

#define RIGEX_LOG_SECTION(Category, SectionName) \
	do { \
		if (FRigExLog::WouldLog(ERigExLogCategory::Category, ERigExLogVerbosity::Info)) \
		{ \
			FRigExLog::Log(ERigExLogCategory::Category, ERigExLogVerbosity::Info, FString(TEXT("=== ")) + TEXT(SectionName) + TEXT(" ===")); \
		} \
	} while (0)
