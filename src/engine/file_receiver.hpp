#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "content.hpp"

namespace clipmesh {

// Writes a received file list under <root>/<YYYYMMDD-HHMMSS>/.
class FileReceiver {
public:
    explicit FileReceiver(std::string root) : root_(std::move(root)) {}

    // Returns the top-level items written (absolute paths), in entry order.
    // A failing entry is logged and skipped.
    std::vector<std::string> receive(const FileList& files,
                                     std::chrono::system_clock::time_point now);

    const std::string& root() const { return root_; }

    static std::string timestamp_dir_name(std::chrono::system_clock::time_point t);

private:
    std::string root_;
};

} // namespace clipmesh
