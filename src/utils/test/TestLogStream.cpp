#include "LogStream.hpp"
#include <cassert>
#include <iostream>

void test_complete_lines_recorded() {
    LogStream out("cluster-a");
    out << "creating vpc" << std::endl;
    out << "vpc " << 42 << " available\n";
    out << "partial";

    assert(out.lines().size() == 2);
    assert(out.lines()[0] == "creating vpc");
    assert(out.lines()[1] == "vpc 42 available");
    out << " line\r\n";
    assert(out.lines().size() == 3);
    assert(out.lines()[2] == "partial line");
    std::cout << "test_complete_lines_recorded passed" << std::endl;
}

void test_empty_lines_kept() {
    LogStream out("cluster-b");
    out << "\n\n";
    assert(out.lines().size() == 2);
    assert(out.lines()[0].empty());
    std::cout << "test_empty_lines_kept passed" << std::endl;
}

int main() {
    test_complete_lines_recorded();
    test_empty_lines_kept();

    std::cout << "All LogStream tests passed!" << std::endl;
    return 0;
}
