// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Math/RigExFalloff.h"

class FRigExParamReader;

namespace RigExSkin::Params
{
	const FName BBones = FName("bbones");
	const FName ChainPriority = FName("skin_chain_priority");
	const FName ConnectMirror = FName("skin_chain_connect_mirror");
	const FName ConnectEnds = FName("skin_chain_connect_ends");
	const FName Sharpen = FName("skin_chain_sharpen");
	const FName RotationIndex = FName("skin_control_rotation_index");
	const FName PivotPos = FName("skin_chain_pivot_pos");
	const FName Falloff = FName("skin_chain_falloff");
	const FName FalloffSpherical = FName("skin_chain_falloff_spherical");
	const FName FalloffLength = FName("skin_chain_falloff_length");
	const FName FalloffTwist = FName("skin_chain_falloff_twist");
	const FName FalloffScale = FName("skin_chain_falloff_scale");
	const FName FalloffToControls = FName("skin_chain_falloff_to_controls");
	const FName MergeParentRotationAndScale = FName("skin_merge_parent_rotation_and_scale");
	const FName MakeDeform = FName("make_deform");
	const FName AnchorHide = FName("skin_anchor_hide");
	const FName GlueHeadMode = FName("skin_glue_head_mode");
	const FName RelinkConstraints = FName("relink_constraints");
	const FName GlueUseTail = FName("skin_glue_use_tail");
	const FName GlueTailReparent = FName("skin_glue_tail_reparent");
}

/** Settings shared by every chain generator */
struct RIGEXSKIN_API FRigExChainDetails
{
	FRigExChainDetails();

	/** B-Bone segments of the deform bones; above 1 the chain gets handle mechanisms */
	int32 BBoneSegments = 10;

	/** Ownership priority; higher wins over depth and naming */
	int32 Priority = 0;

	bool bConnectMirror = true;
	bool bConnectEnds = false;

	/** Joint angle in degrees under which connected ends get a sharper ease. 0 disables. */
	double SharpenThreshold = 0;

	/** Which generator up the hierarchy provides control orientation, 0 is this one */
	int32 RotationIndex = 0;

	bool bMergeParentRotationAndScale = false;

	bool UsesBBones() const { return BBoneSegments > 1; }

	void Read(const FRigExParamReader& InReader);
	bool Validate(const FRigExParamReader& InReader) const;
};

/** Falloff of the start, middle and end drivers of a stretchy chain */
struct RIGEXSKIN_API FRigExFalloffDetails
{
	FRigExFalloffSpec Start = FRigExFalloffSpec(0, false);
	FRigExFalloffSpec Middle = FRigExFalloffSpec(1, false);
	FRigExFalloffSpec End = FRigExFalloffSpec(0, false);

	/** Measure along the chain bones instead of projecting on the start-end axis */
	bool bAlongCurve = false;

	void Read(const FRigExParamReader& InReader);
	bool Validate(const FRigExParamReader& InReader) const;
};

struct RIGEXSKIN_API FRigExStretchyDetails
{
	/** Index of the middle driver; 0 means none */
	int32 PivotPos = 0;

	FRigExFalloffDetails Falloff;

	bool bPropagateTwist = true;
	bool bPropagateScale = false;

	/** Expose propagated twist and scale to merged controls as parent motion */
	bool bPropagateToControls = false;

	bool HasPivot() const { return PivotPos > 0; }

	void Read(const FRigExParamReader& InReader);
	bool Validate(const FRigExParamReader& InReader, const int32 InNumOrgs) const;
};

struct RIGEXSKIN_API FRigExAnchorDetails
{
	bool bMakeDeform = true;
	bool bHideUnlessMerged = false;
	int32 RotationIndex = 0;
	bool bMergeParentRotationAndScale = false;

	void Read(const FRigExParamReader& InReader);
	bool Validate(const FRigExParamReader& InReader) const;
};

enum class ERigExGlueHeadMode : uint8
{
	/** Glue bone becomes a child of the control */
	Child = 0,
	/** Sibling of the control, copying its transform */
	Mirror,
	/** Keeps its parent and copies the control motion including parent induced motion, in local space */
	Reparent,
};

struct RIGEXSKIN_API FRigExGlueDetails
{
	ERigExGlueHeadMode HeadMode = ERigExGlueHeadMode::Child;

	bool bRelinkConstraints = false;
	bool bUseTail = false;

	/** Tail target includes motion induced by its parents */
	bool bTailReparent = false;

	bool UsesTail() const { return bRelinkConstraints && bUseTail; }
	bool RigsOrg() const { return HeadMode != ERigExGlueHeadMode::Child; }

	void Read(const FRigExParamReader& InReader);
};
