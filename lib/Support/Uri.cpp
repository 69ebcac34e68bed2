//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "lspvisor/Support/Uri.h"

namespace lspvisor
{

namespace
{
constexpr llvm::StringLiteral kFileScheme = "file://";
}  // namespace

std::string pathToUri(const llvm::StringRef path)
{
    std::string uri = kFileScheme.str();
    uri.append(path.data(), path.size());
    return uri;
}

std::string uriToPath(llvm::StringRef uri)
{
    uri.consume_front(kFileScheme);
    return uri.str();
}

llvm::StringRef fileNameOf(const llvm::StringRef path)
{
    const std::size_t slash = path.find_last_of('/');
    return slash == llvm::StringRef::npos ? path : path.drop_front(slash + 1);
}

}  // namespace lspvisor
