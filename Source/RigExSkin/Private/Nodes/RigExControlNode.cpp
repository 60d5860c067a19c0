// Copyright 2026 Timothé Lapetite and contributors
// Released under the MIT license https://opensource.org/license/MIT/

#include "Nodes/RigExControlNode.h"

#include "Parents/RigExNodeParents.h"

TSharedPtr<FRigExNodeParent> FRigExControlNode::GetEntryParent(const int32 InEntry) const
{
	if (const TSharedPtr<FRigExNodeParent>* Found = EntryParents.Find(InEntry)) { return *Found; }
	return nullptr;
}

FName FRigExControlNode::GetParentOutputBone() const
{
	if (!MixParentBone.IsNone()) { return MixParentBone; }
	if (!Composed.Parents.IsEmpty() && Composed.Parents[0]) { return Composed.Parents[0]->GetOutputBone(); }
	return NAME_None;
}
