// =============================================================================
// objfs - Local Filesystem Storage
// =============================================================================
// Local files exposed through the System interface. Files are updated in
// place, so the backend declares random-write support and streams opened
// on it use the range-flush variants.
//
// Paths: absolute paths ("/data/file") or file:// URLs.
//
// Parameters:
//   local.create_parents   "true" (default) / "false": create missing
//                          parent directories when writing
// =============================================================================

#ifndef OBJFS_STORAGE_LOCAL_SYSTEM_H
#define OBJFS_STORAGE_LOCAL_SYSTEM_H

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "objfs/storage/system.h"

namespace objfs::storage {

class LocalSystem : public System {
public:
    static constexpr std::string_view kUrlRoot = "file://";
    static constexpr std::string_view kPathRoot = "/";

    explicit LocalSystem(Parameters parameters = {});

    [[nodiscard]] std::string_view storageName() const noexcept override { return "local"; }
    [[nodiscard]] std::vector<std::string> roots() const override;
    [[nodiscard]] ClientArgs getClientArgs(std::string_view path) const override;
    [[nodiscard]] std::unique_ptr<ObjectBackend> openObject(const ClientArgs& args) override;
    [[nodiscard]] BackendTraits traits() const override;
    [[nodiscard]] Parameters storageParameters() const override { return parameters_; }
    [[nodiscard]] std::shared_ptr<System> withParameters(
        const Parameters& parameters) const override;

    /// @brief Filesystem path addressed by client arguments.
    [[nodiscard]] static std::filesystem::path filePath(const ClientArgs& args);

protected:
    [[nodiscard]] Header headObject(const ClientArgs& args) override;

private:
    Parameters parameters_;
    bool createParents_ = true;
};

}  // namespace objfs::storage

#endif  // OBJFS_STORAGE_LOCAL_SYSTEM_H
