// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"

enum class ERigExSkinRigKind : uint8
{
	Anchor = 0,
	BasicChain,
	StretchyChain,
	Glue,
};

/** Strictly ordered generation stages */
enum class ERigExSkinStage : uint8
{
	None = 0,
	Initialize,
	Collect,
	Resolve,
	Compose,
	Build,
	Done,
	Failed,
};

namespace RigExSkin
{
	const FName TypeAnchor = FName("skin.anchor");
	const FName TypeBasicChain = FName("skin.basic_chain");
	const FName TypeStretchyChain = FName("skin.stretchy_chain");
	const FName TypeGlue = FName("skin.glue");

	RIGEXSKIN_API FName GetRigType(const ERigExSkinRigKind InKind);
	RIGEXSKIN_API bool TryGetRigKind(const FName InRigType, ERigExSkinRigKind& OutKind);
	RIGEXSKIN_API const TCHAR* GetStageName(const ERigExSkinStage InStage);

	FORCEINLINE bool IsChainKind(const ERigExSkinRigKind InKind)
	{
		return InKind == ERigExSkinRigKind::BasicChain || InKind == ERigExSkinRigKind::StretchyChain;
	}
}
