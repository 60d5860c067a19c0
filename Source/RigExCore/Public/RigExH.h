// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "HAL/Platform.h"
#include "Math/IntVector.h"
#include "Math/UnrealMathUtility.h"
#include "Math/Vector.h"
#include "Templates/TypeHash.h"

namespace RigEx
{
	// Ordered pair hash
	constexpr FORCEINLINE static uint64 H64(const uint32 A, const uint32 B) { return static_cast<uint64>(A) << 32 | B; }

	// Expand uint64 hash
	constexpr FORCEINLINE static uint32 H64A(const uint64 Hash) { return static_cast<uint32>(Hash >> 32); }
	constexpr FORCEINLINE static uint32 H64B(const uint64 Hash) { return static_cast<uint32>(Hash); }

	template <typename T>
	FORCEINLINE static T SafeScalarTolerance(const T& InValue)
	{
		return FMath::Max(InValue, SMALL_NUMBER);
	}

	/** Grid cell of a position; neighbors within Tolerance are at most one cell away on each axis */
	FORCEINLINE static FInt64Vector3 GridCell(const FVector& Seed, const double Tolerance)
	{
		return FInt64Vector3(
			FMath::FloorToInt64(Seed.X / Tolerance),
			FMath::FloorToInt64(Seed.Y / Tolerance),
			FMath::FloorToInt64(Seed.Z / Tolerance));
	}
}
