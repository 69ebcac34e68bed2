//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Conversions between filesystem paths and `file://` URIs.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_SUPPORT_URI_H
#define LSPVISOR_SUPPORT_URI_H

#include "llvm/ADT/StringRef.h"

#include <string>

namespace lspvisor
{

/// @brief Returns `file://` followed by the path.
[[nodiscard]] std::string pathToUri(llvm::StringRef path);

/// @brief Strips a leading `file://` scheme. Other URIs are returned unchanged.
[[nodiscard]] std::string uriToPath(llvm::StringRef uri);

/// @brief Returns the final path component, or the whole text when it has no separator.
[[nodiscard]] llvm::StringRef fileNameOf(llvm::StringRef path);

}  // namespace lspvisor

#endif  // LSPVISOR_SUPPORT_URI_H
