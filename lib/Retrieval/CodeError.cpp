//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic normalization and finding classification.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Retrieval/CodeError.h"

#include "lspvisor/Support/Uri.h"

#include <chrono>
#include <utility>

namespace lspvisor
{
namespace
{

std::vector<std::string> stringArray(const llvm::json::Object* object, const llvm::StringRef key)
{
    std::vector<std::string> values;
    if (!object)
    {
        return values;
    }
    const auto* array = object->getArray(key);
    if (!array)
    {
        return values;
    }
    for (const auto& item : *array)
    {
        if (const auto text = item.getAsString())
        {
            values.push_back(text->str());
        }
    }
    return values;
}

std::int64_t integerOr(const llvm::json::Object* object, const llvm::StringRef key, const std::int64_t fallback)
{
    if (!object)
    {
        return fallback;
    }
    if (const auto value = object->getInteger(key))
    {
        return *value;
    }
    return fallback;
}

std::optional<std::string> codeText(const llvm::json::Object& diagnostic)
{
    const auto* code = diagnostic.get("code");
    if (!code)
    {
        return std::nullopt;
    }
    if (const auto text = code->getAsString())
    {
        return text->str();
    }
    if (const auto number = code->getAsInteger())
    {
        return std::to_string(*number);
    }
    return std::nullopt;
}

}  // namespace

llvm::StringRef severityName(const Severity severity)
{
    switch (severity)
    {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    case Severity::Hint:
        return "hint";
    }
    return "error";
}

std::optional<Severity> parseSeverity(const llvm::StringRef name)
{
    for (const Severity severity : {Severity::Error, Severity::Warning, Severity::Info, Severity::Hint})
    {
        if (name.equals_insensitive(severityName(severity)))
        {
            return severity;
        }
    }
    return std::nullopt;
}

Severity severityFromLsp(const std::int64_t code)
{
    switch (code)
    {
    case 2:
        return Severity::Warning;
    case 3:
        return Severity::Info;
    case 4:
        return Severity::Hint;
    default:
        return Severity::Error;
    }
}

llvm::StringRef categoryName(const Category category)
{
    switch (category)
    {
    case Category::Syntax:
        return "syntax";
    case Category::Type:
        return "type";
    case Category::Logic:
        return "logic";
    case Category::Performance:
        return "performance";
    case Category::Security:
        return "security";
    case Category::Style:
        return "style";
    case Category::Compatibility:
        return "compatibility";
    case Category::Dependency:
        return "dependency";
    case Category::Unknown:
        return "unknown";
    }
    return "unknown";
}

const std::vector<Category>& allCategories()
{
    static const std::vector<Category> categories{
        Category::Syntax,
        Category::Type,
        Category::Logic,
        Category::Performance,
        Category::Security,
        Category::Style,
        Category::Compatibility,
        Category::Dependency,
        Category::Unknown,
    };
    return categories;
}

Category classifyCategory(const llvm::StringRef source, const llvm::StringRef message)
{
    const std::string     sourceText  = source.lower();
    const std::string     messageText = message.lower();
    const llvm::StringRef src(sourceText);
    const llvm::StringRef msg(messageText);

    if (src.contains("syntax") || msg.contains("parse"))
    {
        return Category::Syntax;
    }
    if (src.contains("type") || msg.contains("type"))
    {
        return Category::Type;
    }
    if (src.contains("security") || msg.contains("security"))
    {
        return Category::Security;
    }
    if (src.contains("performance") || msg.contains("performance"))
    {
        return Category::Performance;
    }
    if (src.contains("style") || src.contains("lint"))
    {
        return Category::Style;
    }
    if (msg.contains("import") || msg.contains("dependency"))
    {
        return Category::Dependency;
    }
    if (msg.contains("compatibility"))
    {
        return Category::Compatibility;
    }
    return Category::Logic;
}

std::string ErrorLocation::rangeText() const
{
    std::string text = std::to_string(line) + ":" + std::to_string(column);
    if (endLine && endColumn)
    {
        text += "-" + std::to_string(*endLine) + ":" + std::to_string(*endColumn);
    }
    return text;
}

llvm::StringRef ErrorLocation::fileName() const
{
    return fileNameOf(filePath);
}

double unixNow()
{
    const auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(sinceEpoch).count();
}

CodeError::CodeError(Fields fields)
    : fields_(std::move(fields))
    , category_(classifyCategory(fields_.source, fields_.message))
    , timestamp_(unixNow())
{
}

CodeError CodeError::fromDiagnostic(const llvm::json::Object& diagnostic, const llvm::StringRef filePath)
{
    const llvm::json::Object* range = diagnostic.getObject("range");
    const llvm::json::Object* start = range ? range->getObject("start") : nullptr;
    const llvm::json::Object* end   = range ? range->getObject("end") : nullptr;

    const std::int64_t startLine      = integerOr(start, "line", 0);
    const std::int64_t startCharacter = integerOr(start, "character", 0);

    Fields fields;
    fields.location.filePath = filePath.str();
    fields.location.line     = startLine + 1;
    fields.location.column   = startCharacter + 1;
    if (end && !end->empty())
    {
        fields.location.endLine   = integerOr(end, "line", 0) + 1;
        fields.location.endColumn = integerOr(end, "character", 0) + 1;
    }

    fields.severity = severityFromLsp(integerOr(&diagnostic, "severity", 1));

    if (const auto id = diagnostic.getString("id"))
    {
        fields.id = id->str();
    }
    else
    {
        fields.id = filePath.str() + "_" + std::to_string(startLine) + "_" + std::to_string(startCharacter);
    }

    if (const auto message = diagnostic.getString("message"))
    {
        fields.message = message->str();
    }
    else
    {
        fields.message = "Unknown error";
    }

    fields.code = codeText(diagnostic);
    if (const auto source = diagnostic.getString("source"))
    {
        fields.source = source->str();
    }

    if (const auto* data = diagnostic.getObject("data"))
    {
        fields.context       = *data;
        fields.suggestions   = stringArray(data, "suggestions");
        fields.relatedErrors = stringArray(data, "relatedErrors");
    }

    return CodeError(std::move(fields));
}

std::string CodeError::displayText() const
{
    return "[" + severityName(fields_.severity).upper() + "] " + fields_.location.fileName().str() + ":" +
           fields_.location.rangeText() + " - " + fields_.message;
}

llvm::json::Value CodeError::toJson() const
{
    llvm::json::Object location{
        {"file_path", fields_.location.filePath},
        {"line", fields_.location.line},
        {"column", fields_.location.column},
        {"end_line", fields_.location.endLine ? llvm::json::Value(*fields_.location.endLine) : llvm::json::Value(nullptr)},
        {"end_column",
         fields_.location.endColumn ? llvm::json::Value(*fields_.location.endColumn) : llvm::json::Value(nullptr)},
    };

    llvm::json::Array suggestions;
    for (const auto& suggestion : fields_.suggestions)
    {
        suggestions.push_back(suggestion);
    }
    llvm::json::Array related;
    for (const auto& relatedId : fields_.relatedErrors)
    {
        related.push_back(relatedId);
    }

    return llvm::json::Object{
        {"id", fields_.id},
        {"message", fields_.message},
        {"severity", severityName(fields_.severity)},
        {"category", categoryName(category_)},
        {"location", std::move(location)},
        {"code", fields_.code ? llvm::json::Value(*fields_.code) : llvm::json::Value(nullptr)},
        {"source", fields_.source},
        {"suggestions", std::move(suggestions)},
        {"context", llvm::json::Object(fields_.context)},
        {"related_errors", std::move(related)},
        {"timestamp", timestamp_},
    };
}

}  // namespace lspvisor
