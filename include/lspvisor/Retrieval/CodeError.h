//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Normalized findings reported by an analysis server.
///
/// A `CodeError` is built once from a raw diagnostic and never modified. Its
/// severity is mapped from the LSP numeric code, its category is derived from
/// keyword heuristics, and its location is converted to 1-based coordinates.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_RETRIEVAL_CODE_ERROR_H
#define LSPVISOR_RETRIEVAL_CODE_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lspvisor
{

/// @brief Finding severity.
enum class Severity
{
    Error,
    Warning,
    Info,
    Hint,
};

/// @brief Finding category.
enum class Category
{
    Syntax,
    Type,
    Logic,
    Performance,
    Security,
    Style,
    Compatibility,
    Dependency,
    Unknown,
};

/// @brief Returns the lowercase severity name (`"error"`, ...).
[[nodiscard]] llvm::StringRef severityName(Severity severity);

/// @brief Parses a lowercase severity name.
[[nodiscard]] std::optional<Severity> parseSeverity(llvm::StringRef name);

/// @brief Maps an LSP numeric severity (1..4). Unknown values map to `Severity::Error`.
[[nodiscard]] Severity severityFromLsp(std::int64_t code);

/// @brief Returns the lowercase category name (`"syntax"`, ...).
[[nodiscard]] llvm::StringRef categoryName(Category category);

/// @brief Every category in declaration order.
[[nodiscard]] const std::vector<Category>& allCategories();

/// @brief Classifies a diagnostic from its source tag and message.
///
/// Keywords are matched case-insensitively in fixed priority: syntax
/// (`syntax` in source or `parse` in message), type, security, performance,
/// style (`style` or `lint` in source), dependency (`import` or `dependency`
/// in message), compatibility (in message), and finally logic.
///
/// @param[in] source Diagnostic source tag.
/// @param[in] message Diagnostic message.
[[nodiscard]] Category classifyCategory(llvm::StringRef source, llvm::StringRef message);

/// @brief Position and extent of a finding, 1-based.
struct ErrorLocation final
{
    std::string                 filePath;
    std::int64_t                line{1};
    std::int64_t                column{1};
    std::optional<std::int64_t> endLine;
    std::optional<std::int64_t> endColumn;

    /// @brief Returns `line:column-endLine:endColumn`, or `line:column` without an end.
    [[nodiscard]] std::string rangeText() const;

    /// @brief Returns the final component of `filePath`.
    [[nodiscard]] llvm::StringRef fileName() const;

    friend bool operator==(const ErrorLocation&, const ErrorLocation&) = default;
};

/// @brief Immutable normalized finding.
class CodeError final
{
public:
    /// @brief Field bundle for direct construction.
    struct Fields final
    {
        std::string                id;
        std::string                message;
        Severity                   severity{Severity::Error};
        ErrorLocation              location;
        std::optional<std::string> code;
        std::string                source{"serena"};
        std::vector<std::string>   suggestions;
        llvm::json::Object         context;
        std::vector<std::string>   relatedErrors;
    };

    /// @brief Builds a finding; the category is derived here and never again.
    explicit CodeError(Fields fields);

    /// @brief Normalizes one LSP diagnostic.
    /// @param[in] diagnostic Raw `{range, severity, message, code, source, data}` object.
    /// @param[in] filePath Path of the file the diagnostic belongs to.
    [[nodiscard]] static CodeError fromDiagnostic(const llvm::json::Object& diagnostic, llvm::StringRef filePath);

    [[nodiscard]] const std::string& id() const
    {
        return fields_.id;
    }

    [[nodiscard]] const std::string& message() const
    {
        return fields_.message;
    }

    [[nodiscard]] Severity severity() const
    {
        return fields_.severity;
    }

    [[nodiscard]] Category category() const
    {
        return category_;
    }

    [[nodiscard]] const ErrorLocation& location() const
    {
        return fields_.location;
    }

    [[nodiscard]] const std::optional<std::string>& code() const
    {
        return fields_.code;
    }

    [[nodiscard]] const std::string& source() const
    {
        return fields_.source;
    }

    [[nodiscard]] const std::vector<std::string>& suggestions() const
    {
        return fields_.suggestions;
    }

    [[nodiscard]] const llvm::json::Object& context() const
    {
        return fields_.context;
    }

    [[nodiscard]] const std::vector<std::string>& relatedErrors() const
    {
        return fields_.relatedErrors;
    }

    /// @brief Creation time in seconds since the Unix epoch.
    [[nodiscard]] double timestamp() const
    {
        return timestamp_;
    }

    /// @brief Returns whether the severity is `Severity::Error`.
    [[nodiscard]] bool isCritical() const
    {
        return fields_.severity == Severity::Error;
    }

    /// @brief Returns `[SEVERITY] <file name>:<range> - <message>`.
    [[nodiscard]] std::string displayText() const;

    /// @brief Exports the finding with snake_case keys.
    [[nodiscard]] llvm::json::Value toJson() const;

private:
    Fields   fields_;
    Category category_;
    double   timestamp_;
};

/// @brief Returns the current time in seconds since the Unix epoch.
[[nodiscard]] double unixNow();

}  // namespace lspvisor

#endif  // LSPVISOR_RETRIEVAL_CODE_ERROR_H
