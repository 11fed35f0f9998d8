#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "clipboard_backend.hpp"

namespace clipmesh {

// Runs argv without a shell. `input` is written to the child's stdin when
// non-null, stdout is captured into `output` when non-null. Children inherit
// no descriptors besides 0-2 and are killed once `timeout` expires.
bool run_process(const std::vector<std::string>& argv,
                 const std::vector<uint8_t>* input,
                 std::vector<uint8_t>* output, int& exit_code,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

// Clipboard driven through external helper tools. Subclasses supply the
// command lines; type negotiation and uri-list handling live here.
class CommandClipboard : public ClipboardBackend {
public:
    bool read_text(std::string& out) override;
    bool write_text(const std::string& text) override;
    bool read_image(ImageData& out) override;
    bool write_image(const ImageData& img) override;
    bool read_files(std::vector<std::string>& paths) override;
    bool write_files(const std::vector<std::string>& paths) override;

protected:
    virtual std::vector<std::string> list_types_cmd() const = 0;
    virtual std::vector<std::string> read_cmd(const std::string& type) const = 0;
    virtual std::vector<std::string> write_cmd(const std::string& type) const = 0;
    virtual const std::vector<std::string>& text_types() const = 0;

private:
    bool list_types(std::vector<std::string>& types);
    bool read_type(const std::string& type, std::vector<uint8_t>& out);
    bool write_type(const std::string& type, const std::vector<uint8_t>& data);
};

class WaylandClipboard : public CommandClipboard {
public:
    const char* name() const override { return "wayland"; }
protected:
    std::vector<std::string> list_types_cmd() const override;
    std::vector<std::string> read_cmd(const std::string& type) const override;
    std::vector<std::string> write_cmd(const std::string& type) const override;
    const std::vector<std::string>& text_types() const override;
};

class X11Clipboard : public CommandClipboard {
public:
    const char* name() const override { return "x11"; }
protected:
    std::vector<std::string> list_types_cmd() const override;
    std::vector<std::string> read_cmd(const std::string& type) const override;
    std::vector<std::string> write_cmd(const std::string& type) const override;
    const std::vector<std::string>& text_types() const override;
};

// text/uri-list helpers, exposed for tests.
std::vector<std::string> parse_uri_list(const std::string& body);
std::string make_uri_list(const std::vector<std::string>& paths);

} // namespace clipmesh
