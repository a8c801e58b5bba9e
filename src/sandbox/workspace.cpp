#include "sandbox/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <stdlib.h>
#include <sys/stat.h>

#include "utils/logging.hpp"

namespace runbox::sandbox {

EphemeralWorkspace::EphemeralWorkspace(PrivateTag, std::filesystem::path dir)
    : dir_(std::move(dir)) {}

EphemeralWorkspace::~EphemeralWorkspace() {
    Remove();
}

std::unique_ptr<EphemeralWorkspace> EphemeralWorkspace::Create(const std::filesystem::path& root,
                                                               const std::string& program) {
    const auto base = root.empty() ? std::filesystem::temp_directory_path() : root;
    std::error_code ec;
    std::filesystem::create_directories(base, ec);
    if (ec) {
        throw std::runtime_error("cannot create workspace root " + base.string() + ": " + ec.message());
    }

    auto pattern = (base / "runbox_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed: " + std::string(std::strerror(errno)));
    }

    auto workspace = std::make_unique<EphemeralWorkspace>(PrivateTag{}, buffer.data());
    // The container user must be able to traverse the directory and read the script.
    if (::chmod(workspace->dir_.c_str(), 0755) != 0) {
        throw std::runtime_error("chmod workspace failed: " + std::string(std::strerror(errno)));
    }

    const auto script = workspace->ScriptPath();
    {
        std::ofstream output(script, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw std::runtime_error("cannot write " + script.string());
        }
        output.write(program.data(), static_cast<std::streamsize>(program.size()));
        if (!output.good()) {
            throw std::runtime_error("short write to " + script.string());
        }
    }
    if (::chmod(script.c_str(), 0644) != 0) {
        throw std::runtime_error("chmod script failed: " + std::string(std::strerror(errno)));
    }
    return workspace;
}

void EphemeralWorkspace::Remove() {
    if (removed_) {
        return;
    }
    removed_ = true;
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    if (ec) {
        utils::LogWarn("system", "Failed to remove workspace " + dir_.string() + ": " + ec.message());
    }
}

}  // namespace runbox::sandbox
