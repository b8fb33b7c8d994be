#ifndef FOLIO_TEST_HELPERS_H
#define FOLIO_TEST_HELPERS_H

#include <gtest/gtest.h>

#include "folio/docx_serializer.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace folio {
namespace test {

inline size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

inline std::string part_content(const std::vector<DocxPart>& parts, const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name) return part.content;
    }
    ADD_FAILURE() << "missing part " << name;
    return "";
}

// Scratch directory unique to the running test, removed by the fixture.
inline std::filesystem::path scratch_dir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string("folio_") + info->test_suite_name() + "_" + info->name();
    return std::filesystem::temp_directory_path() / name;
}

inline std::string write_text_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream f(path, std::ios::binary);
    f << text;
    return path.string();
}

}  // namespace test
}  // namespace folio

#endif // FOLIO_TEST_HELPERS_H
