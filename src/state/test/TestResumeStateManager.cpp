#include "ResumeStateManager.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace {

struct Workspace {
    fs::path root;
    fs::path inputs;
    fs::path outputs;

    explicit Workspace(const std::string& name)
        : root(fs::temp_directory_path() / name), inputs(root / "inputs"), outputs(root / "outputs") {
        fs::remove_all(root);
        fs::create_directories(inputs);
        fs::create_directories(outputs);
    }

    ~Workspace() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::vector<std::string> input_files(const Workspace& ws) {
    return {(ws.inputs / "prd.md").string()};
}

}

void test_fresh_state_regenerates() {
    Workspace ws("agentpipe_state_fresh");
    ResumeStateManager manager(ws.outputs.string());
    assert(manager.load());

    auto decision = manager.should_regenerate("architect", (ws.outputs / "architecture.md").string(), {});
    assert(decision.regenerate);
    assert(decision.reason == "no previous output recorded");
    std::cout << "test_fresh_state_regenerates passed" << std::endl;
}

void test_record_then_up_to_date_across_runs() {
    Workspace ws("agentpipe_state_roundtrip");
    write_file(ws.inputs / "prd.md", "build a service");
    write_file(ws.outputs / "architecture.md", "# Architecture");
    write_file(ws.outputs / "test-plan.md", "# Tests");

    ProjectProfile profile;
    {
        ResumeStateManager manager(ws.outputs.string());
        assert(manager.load());
        manager.update_input_hash(input_files(ws), ws.inputs.string());
        manager.update_config_hash(profile);
        manager.record_output("architect", (ws.outputs / "architecture.md").string(), {});
        manager.record_output("qa", (ws.outputs / "test-plan.md").string(), {"architect"});
        assert(manager.save());
    }
    assert(fs::exists(ws.outputs / ".agentpipe" / ".resume-state.json"));

    ResumeStateManager next(ws.outputs.string());
    assert(next.load());
    next.update_input_hash(input_files(ws), ws.inputs.string());
    next.update_config_hash(profile);

    auto decision = next.should_regenerate("qa", (ws.outputs / "test-plan.md").string(), {"architect"});
    assert(!decision.regenerate);
    assert(decision.reason == "up-to-date");

    ResumeState state = next.snapshot();
    assert(state.task_outputs.at("qa").dependency_hashes.at("architect") ==
           state.task_outputs.at("architect").output_hash);
    std::cout << "test_record_then_up_to_date_across_runs passed" << std::endl;
}

void test_external_edit_and_dependency_change() {
    Workspace ws("agentpipe_state_invalidate");
    write_file(ws.inputs / "prd.md", "requirements");
    write_file(ws.outputs / "architecture.md", "v1");
    write_file(ws.outputs / "test-plan.md", "plan");

    ResumeStateManager manager(ws.outputs.string());
    manager.update_input_hash(input_files(ws), ws.inputs.string());
    manager.update_config_hash(ProjectProfile{});
    manager.record_output("architect", (ws.outputs / "architecture.md").string(), {});
    manager.record_output("qa", (ws.outputs / "test-plan.md").string(), {"architect"});

    write_file(ws.outputs / "test-plan.md", "plan, edited by hand");
    auto decision = manager.should_regenerate("qa", (ws.outputs / "test-plan.md").string(), {"architect"});
    assert(decision.regenerate);
    assert(decision.reason == "output file was modified externally");

    // Regenerated qa, then architect is regenerated with new content
    manager.record_output("qa", (ws.outputs / "test-plan.md").string(), {"architect"});
    write_file(ws.outputs / "architecture.md", "v2");
    manager.record_output("architect", (ws.outputs / "architecture.md").string(), {});

    decision = manager.should_regenerate("qa", (ws.outputs / "test-plan.md").string(), {"architect"});
    assert(decision.regenerate);
    assert(decision.reason == "dependency architect output changed");
    std::cout << "test_external_edit_and_dependency_change passed" << std::endl;
}

void test_input_and_config_change() {
    Workspace ws("agentpipe_state_inputs");
    write_file(ws.inputs / "prd.md", "first draft");
    write_file(ws.outputs / "architecture.md", "arch");

    ProjectProfile profile;
    ResumeStateManager manager(ws.outputs.string());
    manager.update_input_hash(input_files(ws), ws.inputs.string());
    manager.update_config_hash(profile);
    manager.record_output("architect", (ws.outputs / "architecture.md").string(), {});

    write_file(ws.inputs / "prd.md", "second draft");
    manager.update_input_hash(input_files(ws), ws.inputs.string());
    auto decision = manager.should_regenerate("architect", (ws.outputs / "architecture.md").string(), {});
    assert(decision.regenerate);
    assert(decision.reason == "input files changed");

    manager.record_output("architect", (ws.outputs / "architecture.md").string(), {});
    profile.persona = "production";
    manager.update_config_hash(profile);
    decision = manager.should_regenerate("architect", (ws.outputs / "architecture.md").string(), {});
    assert(decision.regenerate);
    assert(decision.reason == "configuration changed");
    std::cout << "test_input_and_config_change passed" << std::endl;
}

void test_profile_hash_properties() {
    ProjectProfile a;
    a.stack["cloud"] = "aws";
    a.stack["database"] = "postgres";

    ProjectProfile b;
    b.stack["database"] = "postgres";
    b.stack["cloud"] = "aws";

    assert(ResumeStateManager::hash_profile(a) == ResumeStateManager::hash_profile(b));

    b.preferences["language"] = "rust";
    assert(ResumeStateManager::hash_profile(a) != ResumeStateManager::hash_profile(b));
    assert(ResumeStateManager::hash_profile(a).size() == 64);
    std::cout << "test_profile_hash_properties passed" << std::endl;
}

void test_corrupt_state_starts_fresh() {
    Workspace ws("agentpipe_state_corrupt");
    write_file(ws.outputs / ".agentpipe" / ".resume-state.json", "{not json");

    ResumeStateManager manager(ws.outputs.string());
    assert(!manager.load());
    assert(manager.snapshot().task_outputs.empty());
    std::cout << "test_corrupt_state_starts_fresh passed" << std::endl;
}

void test_clear_removes_file() {
    Workspace ws("agentpipe_state_clear");
    write_file(ws.outputs / "architecture.md", "arch");

    ResumeStateManager manager(ws.outputs.string());
    manager.record_output("architect", (ws.outputs / "architecture.md").string(), {});
    assert(manager.save());
    assert(fs::exists(manager.state_path()));

    manager.clear();
    assert(!fs::exists(manager.state_path()));
    assert(manager.snapshot().task_outputs.empty());

    auto decision = manager.should_regenerate("architect", (ws.outputs / "architecture.md").string(), {});
    assert(decision.reason == "no previous output recorded");
    std::cout << "test_clear_removes_file passed" << std::endl;
}

void test_record_missing_output_throws() {
    Workspace ws("agentpipe_state_missing");
    ResumeStateManager manager(ws.outputs.string());
    bool thrown = false;
    try {
        manager.record_output("architect", (ws.outputs / "nope.md").string(), {});
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(manager.snapshot().task_outputs.empty());
    (void)thrown;
    std::cout << "test_record_missing_output_throws passed" << std::endl;
}

void test_concurrent_saves_keep_every_record() {
    Workspace ws("agentpipe_state_concurrent");
    const fs::path qa_out = ws.outputs / "test-plan.md";
    const fs::path security_out = ws.outputs / "reports" / "security-assessment-with-a-longer-name.md";
    write_file(qa_out, "# Test plan\n");
    write_file(security_out, "# Security assessment\n");

    for (int trial = 0; trial < 200; ++trial) {
        ResumeStateManager manager(ws.outputs.string());
        manager.clear();

        std::thread qa([&]() {
            manager.record_output("qa", qa_out.string(), {});
            bool saved = manager.save();
            assert(saved);
            (void)saved;
        });
        std::thread security([&]() {
            manager.record_output("security", security_out.string(), {});
            bool saved = manager.save();
            assert(saved);
            (void)saved;
        });
        qa.join();
        security.join();

        ResumeStateManager reloaded(ws.outputs.string());
        bool loaded = reloaded.load();
        assert(loaded);
        (void)loaded;
        const ResumeState state = reloaded.snapshot();
        assert(state.task_outputs.size() == 2);
        assert(state.task_outputs.count("qa") == 1);
        assert(state.task_outputs.count("security") == 1);
        assert(!fs::exists(manager.state_path() + ".tmp"));
    }
    std::cout << "test_concurrent_saves_keep_every_record passed" << std::endl;
}

int main() {
    test_fresh_state_regenerates();
    test_record_then_up_to_date_across_runs();
    test_external_edit_and_dependency_change();
    test_input_and_config_change();
    test_profile_hash_properties();
    test_corrupt_state_starts_fresh();
    test_clear_removes_file();
    test_record_missing_output_throws();
    test_concurrent_saves_keep_every_record();

    std::cout << "All ResumeStateManager tests passed!" << std::endl;
    return 0;
}
