//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Aggregated findings with derived counts.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_RETRIEVAL_ERROR_LIST_H
#define LSPVISOR_RETRIEVAL_ERROR_LIST_H

#include "lspvisor/Retrieval/CodeError.h"

#include "llvm/Support/JSON.h"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace lspvisor
{

/// @brief Ordered findings plus counts and touched files.
///
/// Counts and the file set are recomputed on every mutation and cannot drift
/// from the contained findings.
class ComprehensiveErrorList final
{
public:
    ComprehensiveErrorList();
    explicit ComprehensiveErrorList(std::vector<CodeError> errors);

    /// @brief Appends one finding.
    void addError(CodeError error);

    /// @brief Appends several findings.
    void addErrors(std::vector<CodeError> errors);

    /// @brief Removes every finding.
    void clear();

    [[nodiscard]] const std::vector<CodeError>& errors() const
    {
        return errors_;
    }

    [[nodiscard]] std::size_t totalCount() const
    {
        return errors_.size();
    }

    /// @brief Number of `Severity::Error` findings.
    [[nodiscard]] std::size_t criticalCount() const
    {
        return criticalCount_;
    }

    [[nodiscard]] std::size_t warningCount() const
    {
        return warningCount_;
    }

    /// @brief Number of info and hint findings.
    [[nodiscard]] std::size_t infoCount() const
    {
        return infoCount_;
    }

    /// @brief Distinct file paths of the contained findings.
    [[nodiscard]] const std::set<std::string>& filesAnalyzed() const
    {
        return filesAnalyzed_;
    }

    [[nodiscard]] double analysisTimestamp() const
    {
        return analysisTimestamp_;
    }

    /// @brief Wall time spent producing the list, in seconds.
    [[nodiscard]] double analysisDuration() const
    {
        return analysisDuration_;
    }

    void setAnalysisDuration(double seconds)
    {
        analysisDuration_ = seconds;
    }

    [[nodiscard]] std::vector<CodeError> bySeverity(Severity severity) const;
    [[nodiscard]] std::vector<CodeError> byCategory(Category category) const;
    [[nodiscard]] std::vector<CodeError> byFile(llvm::StringRef filePath) const;
    [[nodiscard]] std::vector<CodeError> criticalErrors() const;

    /// @brief Returns the summary object (`total_errors`, `critical_errors`,
    ///        `warnings`, `info_hints`, `files_with_errors`,
    ///        `category_breakdown`, `analysis_timestamp`, `analysis_duration`).
    [[nodiscard]] llvm::json::Object summary() const;

    /// @brief Returns `{errors: [...], summary: {...}}`.
    [[nodiscard]] llvm::json::Value toJson() const;

private:
    void recount();

    std::vector<CodeError> errors_;
    std::size_t            criticalCount_{0};
    std::size_t            warningCount_{0};
    std::size_t            infoCount_{0};
    std::set<std::string>  filesAnalyzed_;
    double                 analysisTimestamp_;
    double                 analysisDuration_{0.0};
};

}  // namespace lspvisor

#endif  // LSPVISOR_RETRIEVAL_ERROR_LIST_H
