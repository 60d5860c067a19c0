// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#pragma once

#include "CoreMinimal.h"
#include "Nodes/RigExControlNode.h"

class FRigExSkinContext;
class FRigExNodeParent;

/**
 * Finalizes each resolved node: averaged orientation and size over the symmetry group,
 * parent mechanisms built by the owner generators, then the node's own bones.
 */
class RIGEXSKIN_API FRigExParentComposer : public TSharedFromThis<FRigExParentComposer>
{
	TSharedRef<FRigExSkinContext> Context;

public:
	explicit FRigExParentComposer(const TSharedRef<FRigExSkinContext>& InContext);

	const FRigExComposedNode& Compose(FRigExControlNode& InNode) const;
	void ComposeAll() const;

	/** Parent mechanism of one entry, shared with any equal mechanism already built for the node */
	TSharedPtr<FRigExNodeParent> BuildParent(FRigExControlNode& InNode, const FRigExNodeEntry& InEntry, const bool bMergeParentRotationAndScale) const;

	/** True if any entry merged into the node asks for it */
	bool ShouldMergeParentRotationAndScale(const FRigExControlNode& InNode) const;
	bool NeedsReparent(const FRigExControlNode& InNode) const;

	//~ Node bones: control, mix parent, reparent

	void GenerateBones(FRigExControlNode& InNode) const;
	void ParentBones(FRigExControlNode& InNode) const;
	void RigBones(FRigExControlNode& InNode) const;
};
