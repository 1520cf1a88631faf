#pragma once

#include <string>

#include "RunContext.hpp"
#include "TaskDefinition.hpp"

class PayloadRenderer {
public:
    virtual ~PayloadRenderer() = default;

    // Final text dispatched to the task's worker. Throws std::runtime_error on failure.
    virtual std::string render(const TaskDefinition& task,
                               const std::string& output_path,
                               const RunContext& context) = 0;
};

// Placeholder substitution over the task's inline prompt, its prompt_file, or a generic
// instruction. Recognized: {input_path} {prd_path} {input_files} {output_path}
// {output_dir} {persona} {task} {dependency_outputs}
class TemplatePayloadRenderer : public PayloadRenderer {
public:
    explicit TemplatePayloadRenderer(const TaskRegistry& registry) : registry_(registry) {}

    std::string render(const TaskDefinition& task,
                       const std::string& output_path,
                       const RunContext& context) override;

    static const char* default_template();

private:
    std::string load_template(const TaskDefinition& task) const;

    const TaskRegistry& registry_;
};
