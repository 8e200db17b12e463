//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language server session coordinator for request/notification handling.
///
/// This layer wires JSON-RPC protocol messages to document overlays,
/// configuration state, cancellable request scheduling, and telemetry.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_LSP_SERVER_H
#define LLVMBICEP_LSP_SERVER_H

#include "llvmbicep/LSP/CompilationManager.h"
#include "llvmbicep/LSP/DocumentStore.h"
#include "llvmbicep/LSP/RequestScheduler.h"
#include "llvmbicep/LSP/ServerConfig.h"
#include "llvmbicep/LSP/Telemetry.h"
#include "llvmbicep/Materialize/InsertResourceHandler.h"
#include "llvmbicep/Materialize/ResourceFetcher.h"
#include "llvmbicep/Semantics/FileResolver.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>

namespace llvmbicep::lsp
{

/// @brief Creates the fetch collaborator for one `insertResource` request.
using ResourceFetcherFactory = std::function<std::shared_ptr<ResourceFetcher>(const ServerConfig& config)>;

/// @brief LSP server core for message dispatch and state management.
class Server final
{
public:
    /// @brief Outbound transport callback for JSON-RPC messages; called from both threads.
    using SendMessageFn = std::function<void(llvm::json::Value message)>;

    /// @param[in] sendMessage Outbound message sink.
    /// @param[in] metricSink Optional telemetry sample sink.
    /// @param[in] fileResolver Resolver for catalog files; null selects the file system.
    /// @param[in] fetcherFactory Fetcher factory; empty selects @ref SnapshotResourceFetcher.
    Server(SendMessageFn                       sendMessage,
           RequestMetricSink                   metricSink     = {},
           std::shared_ptr<const FileResolver> fileResolver   = nullptr,
           ResourceFetcherFactory              fetcherFactory = {});
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    /// @brief Handles one incoming JSON-RPC message.
    void handleMessage(const llvm::json::Value& message);

    /// @brief Returns whether an `exit` notification was observed.
    [[nodiscard]] bool shouldExit() const
    {
        return shouldExit_;
    }

    /// @brief Returns the LSP-conformant process exit code.
    /// @return `0` after orderly `shutdown`+`exit`, otherwise non-zero.
    [[nodiscard]] int exitCode() const
    {
        return exitCode_;
    }

    [[nodiscard]] bool shutdownRequested() const
    {
        return shutdownRequested_;
    }

    [[nodiscard]] const DocumentStore& documentStore() const
    {
        return documents_;
    }

    [[nodiscard]] const ServerConfig& config() const
    {
        return config_;
    }

    [[nodiscard]] const Telemetry& telemetry() const
    {
        return telemetry_;
    }

    /// @brief Cancels queued requests and joins the request worker.
    void shutdown();

private:
    class ClientEditApplier;

    [[nodiscard]] bool handleRequest(const llvm::json::Object& message,
                                     llvm::StringRef           method,
                                     const llvm::json::Value&  id);
    void               handleNotification(const llvm::json::Object& message, llvm::StringRef method);
    [[nodiscard]] bool handleInsertResource(const llvm::json::Object& message, const llvm::json::Value& id);

    void sendResult(const llvm::json::Value& id, llvm::json::Value result);
    void sendError(const llvm::json::Value& id, int code, std::string message);
    void sendNotification(std::string method, llvm::json::Value params);
    void sendRequest(std::string method, llvm::json::Value params);
    void publishDiagnostics();
    void reconfigure();
    void trace(TraceLevel level, const llvm::Twine& message) const;

    static std::string requestKeyFromId(const llvm::json::Value& id);

    SendMessageFn                   sendMessage_;
    ResourceFetcherFactory          fetcherFactory_;
    DocumentStore                   documents_;
    ServerConfig                    config_;
    CompilationManager              compilations_;
    Telemetry                       telemetry_;
    std::atomic<TraceLevel>         traceLevel_{TraceLevel::Basic};
    std::atomic<std::uint64_t>      nextOutgoingRequestId_{1};
    std::unordered_set<std::string> publishedDiagnosticUris_;
    bool                            shutdownRequested_{false};
    bool                            shouldExit_{false};
    int                             exitCode_{0};
    RequestScheduler                scheduler_;
};

}  // namespace llvmbicep::lsp

#endif  // LLVMBICEP_LSP_SERVER_H
