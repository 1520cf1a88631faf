#include "PayloadRenderer.hpp"
#include "StringUtils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

const char* TemplatePayloadRenderer::default_template() {
    return "You are the {task} specialist for this project ({persona} persona).\n"
           "Read the input documents:\n{input_files}\n"
           "Outputs of earlier stages you can build on:\n{dependency_outputs}\n"
           "Write your deliverable to {output_path} and stop when it is complete.\n";
}

std::string TemplatePayloadRenderer::load_template(const TaskDefinition& task) const {
    if (!task.prompt.empty()) {
        return task.prompt;
    }

    if (task.prompt_file.empty()) {
        return default_template();
    }

    std::ifstream ifs(task.prompt_file);
    if (!ifs) {
        throw std::runtime_error("Failed to read prompt file for " + task.name + ": " + task.prompt_file);
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

std::string TemplatePayloadRenderer::render(const TaskDefinition& task,
                                            const std::string& output_path,
                                            const RunContext& context) {
    std::string payload = load_template(task);

    std::vector<std::string> dependency_outputs;
    for (const auto& dep : task.depends_on) {
        auto it = registry_.find(dep);
        if (it != registry_.end()) {
            fs::path dep_path = fs::absolute(fs::path(context.output_dir) / it->second.output);
            dependency_outputs.push_back("- " + dep + ": " + dep_path.string());
        }
    }

    std::vector<std::string> input_files;
    for (const auto& file : context.input_files) {
        input_files.push_back("- " + file);
    }

    StringUtils::replace_all(payload, "{input_path}", context.primary_file);
    StringUtils::replace_all(payload, "{prd_path}", context.primary_file);
    StringUtils::replace_all(payload, "{input_files}", StringUtils::join(input_files, "\n"));
    StringUtils::replace_all(payload, "{output_path}", output_path);
    StringUtils::replace_all(payload, "{output_dir}", context.output_dir);
    StringUtils::replace_all(payload, "{persona}", context.profile.persona);
    StringUtils::replace_all(payload, "{task}", task.name);
    StringUtils::replace_all(payload, "{dependency_outputs}",
                             dependency_outputs.empty() ? "(none)" : StringUtils::join(dependency_outputs, "\n"));
    return payload;
}
