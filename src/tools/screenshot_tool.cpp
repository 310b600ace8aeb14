#include "screenshot_tool.hpp"
#include "../subprocess.hpp"
#include "../utils.hpp"
#include <stdexcept>

namespace toolchat {

std::string capture_screenshot(const std::vector<std::string>& argv, int timeout_ms) {
    if (argv.empty()) {
        throw std::runtime_error("No screenshot command configured");
    }

    SpawnOptions opts;
    opts.command = argv[0];
    opts.args.assign(argv.begin() + 1, argv.end());

    Subprocess proc;
    proc.spawn(opts);
    proc.close_stdin();

    bool eof = false;
    std::string image = proc.read_all_stdout(timeout_ms, &eof);
    bool timed_out = !eof || !proc.wait_exit(1000);
    proc.terminate(1000);

    std::string err;
    char buf[1024];
    long n;
    while ((n = Subprocess::read_some(proc.stderr_fd(), buf, sizeof(buf), 0)) > 0) {
        err.append(buf, static_cast<size_t>(n));
    }
    proc.close_pipes();

    if (timed_out) {
        throw std::runtime_error("Screenshot command timed out after " +
                                 std::to_string(timeout_ms) + " ms");
    }
    if (proc.exit_code() != 0) {
        std::string msg = "Screenshot command failed (exit " + std::to_string(proc.exit_code()) + ")";
        err = trim(err);
        if (!err.empty()) msg += ": " + err;
        throw std::runtime_error(msg);
    }
    if (image.empty()) {
        throw std::runtime_error("Screenshot command produced no output");
    }
    return base64_encode(image);
}

void register_screenshot_tool(ToolRegistry& reg, const Config& cfg) {
    std::vector<std::string> argv = cfg.screenshot_command;

    ToolDef def;
    def.name = "screenshot";
    def.description = "Capture the screen. Returns the image as a base64 string.";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {}
    })JSON");

    def.func = [argv](const nlohmann::json&) -> nlohmann::json {
        return capture_screenshot(argv);
    };

    reg.register_tool(std::move(def));
}

} // namespace toolchat
