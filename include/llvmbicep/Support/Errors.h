//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error kinds raised by the resource materialization pipeline.
///
/// Synthesis and normalization failures are kept as distinct `llvm::ErrorInfo`
/// types so callers can tell a lowering defect from a schema/rewrite defect.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SUPPORT_ERRORS_H
#define LLVMBICEP_SUPPORT_ERRORS_H

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <system_error>

namespace llvmbicep
{

/// @brief Failure while turning a JSON payload into a declaration syntax tree.
class SynthesisError final : public llvm::ErrorInfo<SynthesisError>
{
public:
    static char ID;

    explicit SynthesisError(std::string detail);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] const std::string& detail() const
    {
        return detail_;
    }

private:
    std::string detail_;
};

/// @brief Failure while normalizing a synthesized declaration against its schema.
class NormalizationError final : public llvm::ErrorInfo<NormalizationError>
{
public:
    static char ID;

    /// @param[in] iteration Zero-based loop iteration that failed.
    /// @param[in] stage Sub-pass that failed (`print`, `recase`, `prune`).
    /// @param[in] detail Underlying failure text.
    NormalizationError(unsigned iteration, std::string stage, std::string detail);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] unsigned iteration() const
    {
        return iteration_;
    }

    [[nodiscard]] const std::string& stage() const
    {
        return stage_;
    }

    [[nodiscard]] const std::string& detail() const
    {
        return detail_;
    }

private:
    unsigned    iteration_;
    std::string stage_;
    std::string detail_;
};

/// @brief Cooperative cancellation observed by a long-running operation.
class OperationCancelledError final : public llvm::ErrorInfo<OperationCancelledError>
{
public:
    static char ID;

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_SUPPORT_ERRORS_H
