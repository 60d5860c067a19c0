// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "RigExModuleInterface.h"

class FRigExSkinModule final : public IRigExModuleInterface
{
	RIGEX_MODULE_BODY

public:
	virtual void UpdateSettingsCache() override;
};
