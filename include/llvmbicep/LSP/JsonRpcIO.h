//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Stdio JSON-RPC framing utilities for Language Server Protocol transport.
///
/// Messages are encoded with `Content-Length` framing and decoded into LLVM
/// JSON values.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_LSP_JSON_RPC_IO_H
#define LLVMBICEP_LSP_JSON_RPC_IO_H

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <iosfwd>
#include <mutex>
#include <optional>

namespace llvmbicep::lsp
{

/// @brief JSON-RPC stream transport with `Content-Length` framing.
class JsonRpcStdioTransport final
{
public:
    JsonRpcStdioTransport(std::istream& in, std::ostream& out);

    /// @brief Reads one framed JSON-RPC message.
    /// @return Parsed payload, `std::nullopt` at end of input, or a framing/parse error.
    llvm::Expected<std::optional<llvm::json::Value>> readMessage();

    /// @brief Writes one framed JSON-RPC message; safe to call from any thread.
    llvm::Error writeMessage(const llvm::json::Value& message);

private:
    std::istream& input_;
    std::ostream& output_;
    std::mutex    writeMutex_;
};

}  // namespace llvmbicep::lsp

#endif  // LLVMBICEP_LSP_JSON_RPC_IO_H
