#include "ParameterContext.hpp"
#include "ScopedEnvVar.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool throws_configuration_error(const std::function<void()>& fn, const std::string& fragment) {
    try {
        fn();
    } catch (const ConfigurationError& e) {
        return std::string(e.what()).find(fragment) != std::string::npos;
    }
    return false;
}

// Keeps the tests independent of the developer's environment and home config
struct IsolatedEnv {
    ScopedEnvVar output_dir{"AGENTPIPE_OUTPUT_DIR", std::nullopt};
    ScopedEnvVar timeout{"AGENTPIPE_TIMEOUT", std::nullopt};
    ScopedEnvVar home{"HOME", (fs::temp_directory_path() / "agentpipe_no_home").string()};
};

}

void test_defaults() {
    IsolatedEnv env;
    ParameterContext ctx;
    const auto& config = ctx.get_config_data();

    assert(config.global.output_dir == "./outputs");
    assert(config.global.timeout == std::chrono::seconds(0));
    assert(config.profile.persona == "balanced");
    assert(config.profile.stack.at("cloud") == "aws");
    assert(config.profile.stack.at("logging") == "stdout");
    assert(config.profile.preferences.at("language") == "go");
    assert(config.profile.preferences.at("containerized") == "true");
    assert(config.worker.base_port == 3284);

    const auto& tasks = ctx.get_tasks();
    assert(tasks.size() == 5);
    assert(tasks.at("architect").output == "architecture.md");
    assert((tasks.at("implementer").depends_on == std::vector<std::string>{"architect", "security"}));
    assert((tasks.at("verifier").depends_on == std::vector<std::string>{"implementer", "qa"}));
    assert(tasks.at("verifier").output == "code/.verified");
    std::cout << "test_defaults passed" << std::endl;
}

void test_commandline_merge() {
    IsolatedEnv env;
    ParameterContext ctx;
    const char* argv[] = {
        "agentpipe",
        "--tasks=qa, security",
        "-o", "/tmp/agentpipe-out",
        "--timeout", "30m",
        "-s",
        "--resume",
        "-p", "Production",
        "-v",
        "docs/prd.md"
    };
    ctx.merge_commandline(12, const_cast<char**>(argv));

    const auto& config = ctx.get_config_data();
    assert((config.run.tasks == std::vector<std::string>{"qa", "security"}));
    assert(config.global.output_dir == "/tmp/agentpipe-out");
    assert(config.global.timeout == std::chrono::minutes(30));
    assert(config.run.sequential);
    assert(config.run.cache_mode == CacheMode::Resume);
    assert(config.profile.persona == "production");
    assert(config.global.verbose);
    assert(config.run.input_path == "docs/prd.md");
    ctx.validate();
    std::cout << "test_commandline_merge passed" << std::endl;
}

void test_force_overrides_resume() {
    IsolatedEnv env;
    ParameterContext ctx;
    const char* argv[] = {"agentpipe", "--resume", "--force", "in.md"};
    ctx.merge_commandline(4, const_cast<char**>(argv));
    assert(ctx.get_config_data().run.cache_mode == CacheMode::Force);

    ParameterContext resume_only;
    const char* resume_argv[] = {"agentpipe", "-r", "in.md"};
    resume_only.merge_commandline(3, const_cast<char**>(resume_argv));
    assert(resume_only.get_config_data().run.cache_mode == CacheMode::Resume);
    std::cout << "test_force_overrides_resume passed" << std::endl;
}

void test_commandline_errors() {
    IsolatedEnv env;
    assert(throws_configuration_error([] {
        ParameterContext ctx;
        const char* argv[] = {"agentpipe", "--bogus"};
        ctx.parse_commandline(2, const_cast<char**>(argv));
    }, "Unknown option: --bogus"));

    assert(throws_configuration_error([] {
        ParameterContext ctx;
        const char* argv[] = {"agentpipe", "--timeout"};
        ctx.parse_commandline(2, const_cast<char**>(argv));
    }, "Option requires a value: --timeout"));

    assert(throws_configuration_error([] {
        ParameterContext ctx;
        const char* argv[] = {"agentpipe", "-t", "soon", "in.md"};
        ctx.merge_commandline(4, const_cast<char**>(argv));
    }, "Invalid duration"));

    assert(throws_configuration_error([] {
        ParameterContext ctx;
        const char* argv[] = {"agentpipe", "a.md", "b.md"};
        ctx.parse_commandline(3, const_cast<char**>(argv));
    }, "Only one input path"));
    std::cout << "test_commandline_errors passed" << std::endl;
}

void test_environment_merge() {
    ScopedEnvVar output_dir("AGENTPIPE_OUTPUT_DIR", std::string("/srv/artifacts"));
    ScopedEnvVar timeout("AGENTPIPE_TIMEOUT", std::string("2h"));

    ParameterContext ctx;
    ctx.merge_environment_vars();
    assert(ctx.get_global_config().output_dir == "/srv/artifacts");
    assert(ctx.get_global_config().timeout == std::chrono::hours(2));
    std::cout << "test_environment_merge passed" << std::endl;
}

void test_yaml_merge() {
    IsolatedEnv env;
    ParameterContext ctx;

    YAML::Node config = YAML::Load(R"(
output_dir: build/agents
timeout: 900
persona: minimal
stack:
  cloud: gcp
  queue: kafka
preferences:
  language: rust
worker:
  command: [agentapi, server, --port, "{port}", --, codex]
  base_port: 4000
tasks:
  design:
    output: design.md
  review:
    output: review.md
    depends_on: [design]
    prompt_file: prompts/review.md
)");
    ctx.merge_yaml(config);

    const auto& data = ctx.get_config_data();
    assert(data.global.output_dir == "build/agents");
    assert(data.global.timeout == std::chrono::seconds(900));
    assert(data.profile.persona == "minimal");

    // Profile maps override key by key
    assert(data.profile.stack.at("cloud") == "gcp");
    assert(data.profile.stack.at("queue") == "kafka");
    assert(data.profile.stack.at("database") == "postgres");
    assert(data.profile.preferences.at("language") == "rust");
    assert(data.profile.preferences.at("api_style") == "rest");

    assert(data.worker.base_port == 4000);
    assert(data.worker.command.back() == "codex");

    // A configured task list replaces the built-in pipeline
    assert(data.tasks.size() == 2);
    assert(data.tasks.at("review").name == "review");
    assert(data.tasks.at("review").prompt_file == "prompts/review.md");
    std::cout << "test_yaml_merge passed" << std::endl;
}

void test_yaml_errors() {
    IsolatedEnv env;
    assert(throws_configuration_error([] {
        ParameterContext ctx;
        ctx.merge_yaml(YAML::Load("concurrency: 4"));
    }, "Unknown configuration key in root: concurrency"));

    assert(throws_configuration_error([] {
        ParameterContext ctx;
        ctx.merge_yaml(YAML::Load("tasks: {}"));
    }, "At least one task"));

    assert(throws_configuration_error([] {
        ParameterContext ctx;
        ctx.merge_yaml(std::string("/nonexistent/agentpipe.yaml"));
    }, "Failed to parse YAML file"));
    std::cout << "test_yaml_errors passed" << std::endl;
}

void test_validate() {
    IsolatedEnv env;
    assert(throws_configuration_error([] {
        ParameterContext ctx;
        const char* argv[] = {"agentpipe", "--persona", "wild", "in.md"};
        ctx.merge_commandline(4, const_cast<char**>(argv));
        ctx.validate();
    }, "Invalid persona 'wild'"));

    assert(throws_configuration_error([] {
        ParameterContext ctx;
        ctx.validate();
    }, "Missing required argument: <input>"));

    assert(throws_configuration_error([] {
        ParameterContext ctx;
        ctx.merge_yaml(YAML::Load("tasks:\n  a:\n    output: a.md\n    depends_on: [ghost]"));
        const char* argv[] = {"agentpipe", "in.md"};
        ctx.merge_commandline(2, const_cast<char**>(argv));
        ctx.validate();
    }, "depends on unknown task 'ghost'"));

    // Status mode does not need an input
    ParameterContext status;
    const char* argv[] = {"agentpipe", "--status"};
    status.merge_commandline(2, const_cast<char**>(argv));
    status.validate();
    assert(status.get_config_data().run.status_only);
    std::cout << "test_validate passed" << std::endl;
}

void test_init_priority() {
    IsolatedEnv env;
    fs::path dir = fs::temp_directory_path() / "agentpipe_param_init";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string config_file = (dir / "pipeline.yaml").string();
    std::ofstream(config_file) << "output_dir: from-yaml\ntimeout: 60\npersona: minimal\n";

    ScopedEnvVar env_timeout("AGENTPIPE_TIMEOUT", std::string("120"));

    ParameterContext ctx;
    std::string config_arg = "--config-file=" + config_file;
    const char* argv[] = {"agentpipe", config_arg.c_str(), "--persona", "production", "in.md"};
    assert(ctx.init(5, const_cast<char**>(argv)));

    const auto& data = ctx.get_config_data();
    assert(data.global.output_dir == "from-yaml");
    assert(data.global.timeout == std::chrono::seconds(120));
    assert(data.profile.persona == "production");
    assert(data.run.cache_mode == CacheMode::Normal);

    fs::remove_all(dir);
    std::cout << "test_init_priority passed" << std::endl;
}

void test_init_help_and_version() {
    IsolatedEnv env;
    {
        ParameterContext ctx;
        const char* argv[] = {"agentpipe", "--help"};
        assert(!ctx.init(2, const_cast<char**>(argv)));
    }
    {
        ParameterContext ctx;
        const char* argv[] = {"agentpipe", "-V"};
        assert(!ctx.init(2, const_cast<char**>(argv)));
    }
    std::cout << "test_init_help_and_version passed" << std::endl;
}

int main() {
    test_defaults();
    test_commandline_merge();
    test_force_overrides_resume();
    test_commandline_errors();
    test_environment_merge();
    test_yaml_merge();
    test_yaml_errors();
    test_validate();
    test_init_priority();
    test_init_help_and_version();

    std::cout << "All ParameterContext tests passed!" << std::endl;
    return 0;
}
