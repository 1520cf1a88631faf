#include "InputDiscovery.hpp"
#include "TaskError.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {

fs::path make_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void touch(const fs::path& path, const std::string& content = "x") {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

}

void test_single_file_input() {
    fs::path dir = make_dir("agentpipe_input_single");
    touch(dir / "requirements.txt");

    InputSet input = InputDiscovery::discover((dir / "requirements.txt").string());
    assert(!input.is_directory);
    assert(input.files.size() == 1);
    assert(input.primary_file == (dir / "requirements.txt").string());
    assert(input.root() == dir.string());
    assert((input.relative_paths() == std::vector<std::string>{"requirements.txt"}));

    fs::remove_all(dir);
    std::cout << "test_single_file_input passed" << std::endl;
}

void test_directory_scan_filters_and_sorts() {
    fs::path dir = make_dir("agentpipe_input_scan");
    touch(dir / "overview.md");
    touch(dir / "api" / "openapi.yaml");
    touch(dir / "data.json");
    touch(dir / "diagram.png");
    touch(dir / ".hidden.md");
    touch(dir / ".git" / "notes.md");

    InputSet input = InputDiscovery::discover(dir.string());
    assert(input.is_directory);
    assert((input.relative_paths() == std::vector<std::string>{"api/openapi.yaml", "data.json", "overview.md"}));
    assert(input.primary_file == (dir / "overview.md").string());
    assert(input.summary().find("3 files") != std::string::npos);

    fs::remove_all(dir);
    std::cout << "test_directory_scan_filters_and_sorts passed" << std::endl;
}

void test_primary_file_priority() {
    assert(InputDiscovery::find_primary_file({"/in/a.txt", "/in/b.md", "/in/Product-PRD.txt"}) == "/in/Product-PRD.txt");
    assert(InputDiscovery::find_primary_file({"/in/a.txt", "/in/b.md", "/in/c.md"}) == "/in/b.md");
    assert(InputDiscovery::find_primary_file({"/in/a.yaml", "/in/b.json"}) == "/in/a.yaml");
    assert(InputDiscovery::find_primary_file({}).empty());
    std::cout << "test_primary_file_priority passed" << std::endl;
}

void test_missing_and_empty_inputs() {
    bool thrown = false;
    try {
        InputDiscovery::discover("/nonexistent/agentpipe/input");
    } catch (const ConfigurationError& e) {
        thrown = std::string(e.what()).find("Input path not found") != std::string::npos;
    }
    assert(thrown);

    fs::path dir = make_dir("agentpipe_input_empty");
    touch(dir / "image.png");
    thrown = false;
    try {
        InputDiscovery::discover(dir.string());
    } catch (const ConfigurationError& e) {
        thrown = std::string(e.what()).find("No supported input files") != std::string::npos;
    }
    assert(thrown);
    (void)thrown;

    fs::remove_all(dir);
    std::cout << "test_missing_and_empty_inputs passed" << std::endl;
}

int main() {
    test_single_file_input();
    test_directory_scan_filters_and_sorts();
    test_primary_file_priority();
    test_missing_and_empty_inputs();

    std::cout << "All InputDiscovery tests passed!" << std::endl;
    return 0;
}
