//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the aggregated finding list.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Retrieval/ErrorList.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace lspvisor
{
namespace
{

template <typename Predicate>
std::vector<CodeError> select(const std::vector<CodeError>& errors, Predicate predicate)
{
    std::vector<CodeError> selected;
    std::copy_if(errors.begin(), errors.end(), std::back_inserter(selected), predicate);
    return selected;
}

}  // namespace

ComprehensiveErrorList::ComprehensiveErrorList()
    : analysisTimestamp_(unixNow())
{
}

ComprehensiveErrorList::ComprehensiveErrorList(std::vector<CodeError> errors)
    : errors_(std::move(errors))
    , analysisTimestamp_(unixNow())
{
    recount();
}

void ComprehensiveErrorList::addError(CodeError error)
{
    errors_.push_back(std::move(error));
    recount();
}

void ComprehensiveErrorList::addErrors(std::vector<CodeError> errors)
{
    errors_.insert(errors_.end(), std::make_move_iterator(errors.begin()), std::make_move_iterator(errors.end()));
    recount();
}

void ComprehensiveErrorList::clear()
{
    errors_.clear();
    recount();
}

void ComprehensiveErrorList::recount()
{
    criticalCount_ = 0;
    warningCount_  = 0;
    infoCount_     = 0;
    filesAnalyzed_.clear();
    for (const auto& error : errors_)
    {
        switch (error.severity())
        {
        case Severity::Error:
            ++criticalCount_;
            break;
        case Severity::Warning:
            ++warningCount_;
            break;
        case Severity::Info:
        case Severity::Hint:
            ++infoCount_;
            break;
        }
        filesAnalyzed_.insert(error.location().filePath);
    }
}

std::vector<CodeError> ComprehensiveErrorList::bySeverity(const Severity severity) const
{
    return select(errors_, [severity](const CodeError& error) { return error.severity() == severity; });
}

std::vector<CodeError> ComprehensiveErrorList::byCategory(const Category category) const
{
    return select(errors_, [category](const CodeError& error) { return error.category() == category; });
}

std::vector<CodeError> ComprehensiveErrorList::byFile(const llvm::StringRef filePath) const
{
    return select(errors_, [filePath](const CodeError& error) { return error.location().filePath == filePath; });
}

std::vector<CodeError> ComprehensiveErrorList::criticalErrors() const
{
    return bySeverity(Severity::Error);
}

llvm::json::Object ComprehensiveErrorList::summary() const
{
    llvm::json::Object breakdown;
    for (const Category category : allCategories())
    {
        const auto count = std::count_if(errors_.begin(), errors_.end(), [category](const CodeError& error) {
            return error.category() == category;
        });
        breakdown[categoryName(category)] = static_cast<std::int64_t>(count);
    }

    return llvm::json::Object{
        {"total_errors", static_cast<std::int64_t>(totalCount())},
        {"critical_errors", static_cast<std::int64_t>(criticalCount_)},
        {"warnings", static_cast<std::int64_t>(warningCount_)},
        {"info_hints", static_cast<std::int64_t>(infoCount_)},
        {"files_with_errors", static_cast<std::int64_t>(filesAnalyzed_.size())},
        {"category_breakdown", std::move(breakdown)},
        {"analysis_timestamp", analysisTimestamp_},
        {"analysis_duration", analysisDuration_},
    };
}

llvm::json::Value ComprehensiveErrorList::toJson() const
{
    llvm::json::Array errors;
    for (const auto& error : errors_)
    {
        errors.push_back(error.toJson());
    }
    return llvm::json::Object{{"errors", std::move(errors)}, {"summary", summary()}};
}

}  // namespace lspvisor
