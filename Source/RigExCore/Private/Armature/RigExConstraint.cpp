// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Armature/RigExConstraint.h"

const TCHAR* FRigExConstraint::GetKindName(const ERigExConstraintKind InKind)
{
	switch (InKind)
	{
	case ERigExConstraintKind::CopyLocation: return TEXT("COPY_LOCATION");
	case ERigExConstraintKind::CopyRotation: return TEXT("COPY_ROTATION");
	case ERigExConstraintKind::CopyScale: return TEXT("COPY_SCALE");
	case ERigExConstraintKind::CopyTransforms: return TEXT("COPY_TRANSFORMS");
	case ERigExConstraintKind::DampedTrack: return TEXT("DAMPED_TRACK");
	case ERigExConstraintKind::StretchTo: return TEXT("STRETCH_TO");
	case ERigExConstraintKind::LimitRotation: return TEXT("LIMIT_ROTATION");
	case ERigExConstraintKind::Armature: return TEXT("ARMATURE");
	case ERigExConstraintKind::ChildOf: return TEXT("CHILD_OF");
	default: return TEXT("UNKNOWN");
	}
}
