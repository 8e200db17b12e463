//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `bicepd` Language Server Protocol executable.
///
/// The process runs a stdio JSON-RPC loop and dispatches protocol messages to
/// the LSP server core.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/LSP/JsonRpcIO.h"
#include "llvmbicep/LSP/Server.h"
#include "llvmbicep/Version.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <iostream>

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);
    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "bicepd " << llvmbicep::kVersionString << "\n";
            return 0;
        }
    }

    llvmbicep::lsp::JsonRpcStdioTransport transport(std::cin, std::cout);
    llvmbicep::lsp::Server                server(
        [&transport](llvm::json::Value message) {
            if (auto error = transport.writeMessage(message))
            {
                llvm::errs() << "[bicepd] " << llvm::toString(std::move(error)) << "\n";
            }
        },
        [](const llvmbicep::lsp::RequestMetric& metric) {
            llvm::errs() << "[bicepd][telemetry] method=" << metric.method
                         << " latency_us=" << static_cast<std::uint64_t>(metric.latencyMicros)
                         << " outcome=" << metric.outcome << "\n";
        });

    while (!server.shouldExit())
    {
        auto message = transport.readMessage();
        if (!message)
        {
            llvm::errs() << "[bicepd] " << llvm::toString(message.takeError()) << "\n";
            break;
        }
        if (!*message)
        {
            break;
        }
        server.handleMessage(**message);
    }

    server.shutdown();
    return server.exitCode();
}
