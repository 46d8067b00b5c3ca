// actflow/codec/workflow_serializer.h
#ifndef ACTFLOW_CODEC_WORKFLOW_SERIALIZER_H
#define ACTFLOW_CODEC_WORKFLOW_SERIALIZER_H

#include "actflow/core/types.h"
#include <string>

namespace actflow {

// Emits [workflow], one [node:ID] block per node, [edges] (valid edges only), [env].
// Re-parsing the output yields an equal Workflow.
std::string serialize_workflow(const Workflow& wf);

// Right-hand side of `key = value`: strings quoted, objects/arrays as JSON
std::string format_assignment_value(const Value& value);

} // namespace actflow

#endif // ACTFLOW_CODEC_WORKFLOW_SERIALIZER_H
