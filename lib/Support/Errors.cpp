//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements pipeline error kinds.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/Support/Errors.h"

#include <utility>

namespace llvmbicep
{

char SynthesisError::ID          = 0;
char NormalizationError::ID      = 0;
char OperationCancelledError::ID = 0;

SynthesisError::SynthesisError(std::string detail)
    : detail_(std::move(detail))
{
}

void SynthesisError::log(llvm::raw_ostream& os) const
{
    os << "declaration synthesis failed: " << detail_;
}

std::error_code SynthesisError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

NormalizationError::NormalizationError(const unsigned iteration, std::string stage, std::string detail)
    : iteration_(iteration)
    , stage_(std::move(stage))
    , detail_(std::move(detail))
{
}

void NormalizationError::log(llvm::raw_ostream& os) const
{
    os << "normalization failed in iteration " << iteration_ << " (" << stage_ << "): " << detail_;
}

std::error_code NormalizationError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

void OperationCancelledError::log(llvm::raw_ostream& os) const
{
    os << "operation cancelled";
}

std::error_code OperationCancelledError::convertToErrorCode() const
{
    return std::make_error_code(std::errc::operation_canceled);
}

}  // namespace llvmbicep
