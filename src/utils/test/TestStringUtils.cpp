#include "StringUtils.hpp"
#include <cassert>
#include <iostream>

void test_split_trims_and_drops_empty() {
    auto items = StringUtils::split(" architect, qa ,,security ", ',');
    assert(items.size() == 3);
    assert(items[0] == "architect");
    assert(items[1] == "qa");
    assert(items[2] == "security");
    assert(StringUtils::split(" , ", ',').empty());
    std::cout << "test_split_trims_and_drops_empty passed" << std::endl;
}

void test_join() {
    assert(StringUtils::join({"a", "b", "c"}, ", ") == "a, b, c");
    assert(StringUtils::join({}, ", ").empty());
    assert(StringUtils::join({"only"}, "-") == "only");
    std::cout << "test_join passed" << std::endl;
}

void test_replace_all() {
    std::string text = "{task} writes {output_path}; {task} again";
    StringUtils::replace_all(text, "{task}", "qa");
    assert(text == "qa writes {output_path}; qa again");

    std::string recursive = "{x}";
    StringUtils::replace_all(recursive, "{x}", "{x}{x}");
    assert(recursive == "{x}{x}");
    std::cout << "test_replace_all passed" << std::endl;
}

void test_case_helpers() {
    assert(StringUtils::to_lower("PRD-Draft.MD") == "prd-draft.md");
    assert(StringUtils::contains_ignore_case("Product-PRD.md", "prd"));
    assert(!StringUtils::contains_ignore_case("notes.md", "prd"));

    std::string padded = "\t balanced \n";
    StringUtils::trim(padded);
    assert(padded == "balanced");
    std::cout << "test_case_helpers passed" << std::endl;
}

int main() {
    test_split_trims_and_drops_empty();
    test_join();
    test_replace_all();
    test_case_helpers();

    std::cout << "All StringUtils tests passed!" << std::endl;
    return 0;
}
