// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Core/RigExSkinCommon.h"

namespace RigExSkin
{
	FName GetRigType(const ERigExSkinRigKind InKind)
	{
		switch (InKind)
		{
		case ERigExSkinRigKind::Anchor: return TypeAnchor;
		case ERigExSkinRigKind::BasicChain: return TypeBasicChain;
		case ERigExSkinRigKind::StretchyChain: return TypeStretchyChain;
		case ERigExSkinRigKind::Glue: return TypeGlue;
		default: return NAME_None;
		}
	}

	bool TryGetRigKind(const FName InRigType, ERigExSkinRigKind& OutKind)
	{
		if (InRigType == TypeAnchor) { OutKind = ERigExSkinRigKind::Anchor; }
		else if (InRigType == TypeBasicChain) { OutKind = ERigExSkinRigKind::BasicChain; }
		else if (InRigType == TypeStretchyChain) { OutKind = ERigExSkinRigKind::StretchyChain; }
		else if (InRigType == TypeGlue) { OutKind = ERigExSkinRigKind::Glue; }
		else { return false; }
		return true;
	}

	const TCHAR* GetStageName(const ERigExSkinStage InStage)
	{
		switch (InStage)
		{
		case ERigExSkinStage::None: return TEXT("None");
		case ERigExSkinStage::Initialize: return TEXT("Initialize");
		case ERigExSkinStage::Collect: return TEXT("Collect");
		case ERigExSkinStage::Resolve: return TEXT("Resolve");
		case ERigExSkinStage::Compose: return TEXT("Compose");
		case ERigExSkinStage::Build: return TEXT("Build");
		case ERigExSkinStage::Done: return TEXT("Done");
		case ERigExSkinStage::Failed: return TEXT("Failed");
		default: return TEXT("Unknown");
		}
	}
}
