//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// On-disk persistence of server configurations.
///
/// Each configuration is stored as `<directory>/<name>.json`. Writes go to a
/// temporary file that is renamed over the target.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_MANAGER_CONFIG_STORE_H
#define LSPVISOR_MANAGER_CONFIG_STORE_H

#include "lspvisor/Manager/ServerConfig.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace lspvisor
{

/// @brief Directory of persisted server configurations.
class ConfigStore final
{
public:
    /// @brief Creates a store rooted at `directory`. The directory is created on first write.
    explicit ConfigStore(std::string directory);

    /// @brief Returns `$LSPVISOR_CONFIG_DIR`, else `$HOME/.lspvisor/servers`.
    [[nodiscard]] static std::string defaultDirectory();

    [[nodiscard]] const std::string& directory() const
    {
        return directory_;
    }

    /// @brief Returns the file holding the named configuration.
    [[nodiscard]] std::string pathFor(llvm::StringRef name) const;

    /// @brief Writes one configuration, replacing any previous record of that name.
    [[nodiscard]] llvm::Error save(const ServerConfig& config) const;

    /// @brief Deletes the named record. A missing record is not an error.
    [[nodiscard]] llvm::Error remove(llvm::StringRef name) const;

    /// @brief Loads every record in the directory, ordered by file name.
    ///
    /// Unreadable or malformed files are logged and skipped.
    [[nodiscard]] std::vector<ServerConfig> loadAll() const;

    /// @brief Loads one configuration file.
    [[nodiscard]] static llvm::Expected<ServerConfig> loadFile(llvm::StringRef path);

private:
    std::string directory_;
};

}  // namespace lspvisor

#endif  // LSPVISOR_MANAGER_CONFIG_STORE_H
