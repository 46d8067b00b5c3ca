// actflow/codec/workflow_validator.h
#ifndef ACTFLOW_CODEC_WORKFLOW_VALIDATOR_H
#define ACTFLOW_CODEC_WORKFLOW_VALIDATOR_H

#include "actflow/codec/workflow_parser.h"
#include "actflow/core/types.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace actflow {

// Thrown by the execution path; carries every reason the workflow was refused
class WorkflowValidationError : public std::runtime_error {
public:
    explicit WorkflowValidationError(std::vector<std::string> reasons);

    const std::vector<std::string>& reasons() const noexcept { return reasons_; }

private:
    std::vector<std::string> reasons_;
};

class WorkflowValidator {
public:
    // Schema problems that block execution: no nodes, empty type/app_name,
    // a start_node that is set but does not resolve
    std::vector<std::string> check(const Workflow& wf) const;

    // Editor repairs: fills defaults, drops dangling edges, resolves start_node.
    // Returns a note for every change made.
    std::vector<std::string> normalize(Workflow& wf) const;

    // check() then normalize(); throws WorkflowValidationError on any problem
    void validate(Workflow& wf) const;
};

// Editor path: never throws, is_valid only reflects whether parsing threw
ParseResult parse_lenient(const std::string& text);

// Execution path
Workflow parse_strict(const std::string& text);

} // namespace actflow

#endif // ACTFLOW_CODEC_WORKFLOW_VALIDATOR_H
