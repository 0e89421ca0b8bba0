#pragma once

#include "flowdiff/process.hpp"
#include <filesystem>
#include <fstream>
#include <string>

namespace flowdiff {
namespace test {

// Scratch project directory removed when the test ends
class TemporaryProject {
public:

    TemporaryProject() : dir_("flowdiff-test-") {}

    fs::path AddFile(const fs::path &relative, const std::string &content = "") const {
        const fs::path full_path = dir_.path() / relative;
        fs::create_directories(full_path.parent_path());
        std::ofstream stream(full_path, std::ios::binary | std::ios::trunc);
        stream << content;
        return full_path;
    }

    void RemoveFile(const fs::path &relative) const { fs::remove(dir_.path() / relative); }

    const fs::path &root() const { return dir_.path(); }

private:

    ScopedTempDir dir_;
};

} // namespace test
} // namespace flowdiff
