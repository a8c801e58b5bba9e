#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace runbox::sandbox {

// Private host directory holding the submitted program as script.py.
// Removed on destruction unless Remove() already ran.
class EphemeralWorkspace {
    struct PrivateTag {};

public:
    static constexpr const char* kScriptName = "script.py";

    EphemeralWorkspace(PrivateTag, std::filesystem::path dir);

    EphemeralWorkspace(const EphemeralWorkspace&) = delete;
    EphemeralWorkspace& operator=(const EphemeralWorkspace&) = delete;
    ~EphemeralWorkspace();

    // Creates runbox_XXXXXX under root (system temp dir when empty) and writes the program.
    static std::unique_ptr<EphemeralWorkspace> Create(const std::filesystem::path& root,
                                                      const std::string& program);

    const std::filesystem::path& Dir() const { return dir_; }
    std::filesystem::path ScriptPath() const { return dir_ / kScriptName; }

    // Best effort, idempotent.
    void Remove();
    bool Removed() const { return removed_; }

private:
    std::filesystem::path dir_;
    bool removed_ = false;
};

}  // namespace runbox::sandbox
