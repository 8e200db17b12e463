//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements LSP message dispatch, state updates, and response handling.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/LSP/Server.h"

#include "llvmbicep/Version.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace llvmbicep::lsp
{
namespace
{

constexpr int JsonRpcErrorInvalidParams    = -32602;
constexpr int JsonRpcErrorMethodNotFound   = -32601;
constexpr int JsonRpcErrorInternal         = -32603;
constexpr int JsonRpcErrorRequestCancelled = -32800;

const llvm::json::Object* getObjectMember(const llvm::json::Value* value, llvm::StringRef key)
{
    if (!value)
    {
        return nullptr;
    }
    const auto* object = value->getAsObject();
    if (!object)
    {
        return nullptr;
    }
    return object->getObject(key);
}

std::optional<std::string> parseTextDocumentUri(const llvm::json::Value* params)
{
    const auto* textDocument = getObjectMember(params, "textDocument");
    if (!textDocument)
    {
        return std::nullopt;
    }
    const auto uri = textDocument->getString("uri");
    if (!uri)
    {
        return std::nullopt;
    }
    return uri->str();
}

std::optional<std::int64_t> parseTextDocumentVersion(const llvm::json::Value* params)
{
    const auto* textDocument = getObjectMember(params, "textDocument");
    if (!textDocument)
    {
        return std::nullopt;
    }
    const auto version = textDocument->getInteger("version");
    if (!version)
    {
        return std::nullopt;
    }
    return *version;
}

std::optional<std::string> parseDidOpenText(const llvm::json::Value* params)
{
    const auto* textDocument = getObjectMember(params, "textDocument");
    if (!textDocument)
    {
        return std::nullopt;
    }
    const auto text = textDocument->getString("text");
    if (!text)
    {
        return std::nullopt;
    }
    return text->str();
}

/// Full synchronization: the last change carries the whole document.
std::optional<std::string> parseDidChangeText(const llvm::json::Value* params)
{
    if (!params || !params->getAsObject())
    {
        return std::nullopt;
    }
    const auto* changes = params->getAsObject()->getArray("contentChanges");
    if (!changes || changes->empty())
    {
        return std::nullopt;
    }
    const auto* lastChange = changes->back().getAsObject();
    if (!lastChange)
    {
        return std::nullopt;
    }
    const auto text = lastChange->getString("text");
    if (!text)
    {
        return std::nullopt;
    }
    return text->str();
}

std::optional<InsertResourceParams> parseInsertResourceParams(const llvm::json::Value* params)
{
    const auto uri = parseTextDocumentUri(params);
    if (!uri)
    {
        return std::nullopt;
    }
    const auto* position = getObjectMember(params, "position");
    if (!position)
    {
        return std::nullopt;
    }
    const auto line      = position->getInteger("line");
    const auto character = position->getInteger("character");
    if (!line || !character || *line < 0 || *character < 0)
    {
        return std::nullopt;
    }
    const auto resourceId = params->getAsObject()->getString("resourceId");
    if (!resourceId)
    {
        return std::nullopt;
    }
    return InsertResourceParams{*uri,
                                Position{static_cast<std::uint32_t>(*line), static_cast<std::uint32_t>(*character)},
                                resourceId->str()};
}

llvm::json::Value cloneJsonId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return llvm::json::Value(text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return llvm::json::Value(*integer);
    }
    if (const auto number = id.getAsNumber())
    {
        return llvm::json::Value(*number);
    }
    return llvm::json::Value(nullptr);
}

llvm::json::Object positionToLsp(const Position& position)
{
    return llvm::json::Object{
        {"line", static_cast<std::int64_t>(position.line)},
        {"character", static_cast<std::int64_t>(position.character)},
    };
}

llvm::json::Object rangeToLsp(const Range& range)
{
    return llvm::json::Object{
        {"start", positionToLsp(range.start)},
        {"end", positionToLsp(range.end)},
    };
}

int diagnosticSeverityToLsp(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Error:
        return 1;
    case DiagnosticLevel::Warning:
        return 2;
    case DiagnosticLevel::Note:
        return 3;
    }
    return 3;
}

llvm::json::Value toLspDiagnostic(const Diagnostic& diagnostic, const LineStarts& lineStarts)
{
    return llvm::json::Object{
        {"range", rangeToLsp(lineStarts.rangeOf(diagnostic.span))},
        {"severity", diagnosticSeverityToLsp(diagnostic.level)},
        {"code", diagnostic.code},
        {"source", "bicepd"},
        {"message", diagnostic.message},
    };
}

llvm::json::Value workspaceEditToLsp(const EditDescriptor& edit)
{
    llvm::json::Object changes;
    changes[edit.uri] = llvm::json::Array{
        llvm::json::Object{
            {"range", rangeToLsp(edit.range)},
            {"newText", edit.newText},
        },
    };
    return llvm::json::Object{{"changes", std::move(changes)}};
}

}  // namespace

/// Forwards the edit to the client as a `workspace/applyEdit` request.
class Server::ClientEditApplier final : public EditApplier
{
public:
    explicit ClientEditApplier(Server& server)
        : server_(server)
    {
    }

    llvm::Error apply(const EditDescriptor& edit) override
    {
        server_.sendRequest("workspace/applyEdit",
                            llvm::json::Object{
                                {"label", "Insert resource"},
                                {"edit", workspaceEditToLsp(edit)},
                            });
        return llvm::Error::success();
    }

private:
    Server& server_;
};

Server::Server(SendMessageFn                       sendMessage,
               RequestMetricSink                   metricSink,
               std::shared_ptr<const FileResolver> fileResolver,
               ResourceFetcherFactory              fetcherFactory)
    : sendMessage_(std::move(sendMessage))
    , fetcherFactory_(std::move(fetcherFactory))
    , compilations_(documents_, std::move(fileResolver))
{
    if (!fetcherFactory_)
    {
        fetcherFactory_ = [](const ServerConfig& config) {
            return std::make_shared<SnapshotResourceFetcher>(config.resourceSnapshotDir);
        };
    }
    telemetry_.setSink(std::move(metricSink));
    reconfigure();
}

Server::~Server()
{
    shutdown();
}

void Server::handleMessage(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return;
    }

    const auto method = object->getString("method");
    if (!method)
    {
        // Responses to server-initiated requests carry no method.
        if (const auto* error = object->getObject("error"))
        {
            trace(TraceLevel::Basic, "client rejected request: " + error->getString("message").getValueOr("").str());
        }
        return;
    }

    if (const auto* id = object->get("id"))
    {
        const auto start        = std::chrono::steady_clock::now();
        const bool asynchronous = handleRequest(*object, *method, *id);
        if (!asynchronous)
        {
            const auto end = std::chrono::steady_clock::now();
            telemetry_.record(method->str(),
                              static_cast<std::uint64_t>(
                                  std::chrono::duration_cast<std::chrono::microseconds>(end - start).count()),
                              "ok");
        }
        return;
    }

    handleNotification(*object, *method);
}

bool Server::handleRequest(const llvm::json::Object& message, const llvm::StringRef method, const llvm::json::Value& id)
{
    if (method == "initialize")
    {
        if (const auto* options = getObjectMember(message.get("params"), "initializationOptions"))
        {
            applySettings(*options, config_);
            reconfigure();
        }
        llvm::json::Object result;
        result["capabilities"] = llvm::json::Object{
            {"textDocumentSync", llvm::json::Object{{"openClose", true}, {"change", 1}}},
            {"experimental", llvm::json::Object{{"insertResourceProvider", true}}},
        };
        result["serverInfo"] = llvm::json::Object{{"name", "bicepd"}, {"version", kVersionString}};
        sendResult(id, std::move(result));
        return false;
    }

    if (method == "shutdown")
    {
        shutdownRequested_ = true;
        sendResult(id, llvm::json::Value(nullptr));
        return false;
    }

    if (method == "textDocument/insertResource")
    {
        return handleInsertResource(message, id);
    }

    sendError(id, JsonRpcErrorMethodNotFound, "method not found: " + method.str());
    return false;
}

bool Server::handleInsertResource(const llvm::json::Object& message, const llvm::json::Value& id)
{
    const auto params = parseInsertResourceParams(message.get("params"));
    if (!params)
    {
        sendError(id, JsonRpcErrorInvalidParams, "expected textDocument.uri, position and resourceId");
        return false;
    }

    std::shared_ptr<ResourceFetcher> fetcher = fetcherFactory_(config_);
    auto                             outcome = std::make_shared<std::string>("ok");
    const std::string                key     = requestKeyFromId(id);

    trace(TraceLevel::Verbose, "insertResource " + params->resourceId + " into " + params->uri);

    const bool queued = scheduler_.enqueue(
        key,
        "textDocument/insertResource",
        [this, request = *params, fetcher, outcome](const CancellationToken& token) -> llvm::Expected<llvm::json::Value> {
            ClientEditApplier     applier(*this);
            InsertResourceHandler handler(compilations_, *fetcher, applier);
            auto                  result = handler.handle(request, token);
            if (!result)
            {
                return result.takeError();
            }
            *outcome = insertResourceOutcomeName(*result);
            if (*result != InsertResourceOutcome::Applied)
            {
                trace(TraceLevel::Verbose, llvm::Twine("insertResource aborted: ") + *outcome);
            }
            return llvm::json::Value(nullptr);
        },
        [this, requestId = cloneJsonId(id), outcome](RequestTaskResult result, const std::uint64_t latencyMicros) {
            const std::string requestMethod = "textDocument/insertResource";
            if (result.status == RequestTaskStatus::Completed)
            {
                sendResult(requestId, std::move(result.value));
                telemetry_.record(requestMethod, latencyMicros, *outcome);
                return;
            }
            if (result.status == RequestTaskStatus::Cancelled)
            {
                sendError(requestId, JsonRpcErrorRequestCancelled, "request cancelled");
                telemetry_.record(requestMethod, latencyMicros, "cancelled");
                return;
            }
            trace(TraceLevel::Basic, "insertResource failed: " + result.errorMessage);
            sendError(requestId, JsonRpcErrorInternal, "failed to insert resource");
            telemetry_.record(requestMethod, latencyMicros, "failed");
        });

    if (!queued)
    {
        sendError(id, JsonRpcErrorInternal, "failed to queue request");
        return false;
    }
    return true;
}

void Server::handleNotification(const llvm::json::Object& message, const llvm::StringRef method)
{
    if (method == "textDocument/didOpen")
    {
        const auto* params  = message.get("params");
        const auto  uri     = parseTextDocumentUri(params);
        const auto  text    = parseDidOpenText(params);
        const auto  version = parseTextDocumentVersion(params).value_or(0);
        if (uri && text)
        {
            documents_.open(*uri, *text, version);
            publishDiagnostics();
        }
        return;
    }

    if (method == "textDocument/didChange")
    {
        const auto* params  = message.get("params");
        const auto  uri     = parseTextDocumentUri(params);
        const auto  text    = parseDidChangeText(params);
        const auto  version = parseTextDocumentVersion(params).value_or(0);
        if (uri && text)
        {
            if (!documents_.applyFullTextChange(*uri, *text, version))
            {
                trace(TraceLevel::Basic, "didChange for unopened document " + *uri);
                return;
            }
            publishDiagnostics();
        }
        return;
    }

    if (method == "textDocument/didClose")
    {
        if (const auto uri = parseTextDocumentUri(message.get("params")))
        {
            if (documents_.close(*uri))
            {
                compilations_.forget(*uri);
            }
            publishDiagnostics();
        }
        return;
    }

    if (method == "workspace/didChangeConfiguration")
    {
        if (const auto* params = message.get("params"))
        {
            if (applyDidChangeConfiguration(*params, config_))
            {
                reconfigure();
                publishDiagnostics();
            }
        }
        return;
    }

    if (method == "$/cancelRequest")
    {
        const auto* params = message.get("params");
        if (!params || !params->getAsObject())
        {
            return;
        }
        if (const auto* id = params->getAsObject()->get("id"))
        {
            if (!scheduler_.cancel(requestKeyFromId(*id)))
            {
                trace(TraceLevel::Verbose, "cancel for unknown request " + requestKeyFromId(*id));
            }
        }
        return;
    }

    if (method == "exit")
    {
        shouldExit_ = true;
        if (!shutdownRequested_)
        {
            exitCode_ = 1;
        }
        return;
    }
}

void Server::sendResult(const llvm::json::Value& id, llvm::json::Value result)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"result", std::move(result)},
    });
}

void Server::sendError(const llvm::json::Value& id, const int code, std::string message)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"error", llvm::json::Object{{"code", code}, {"message", std::move(message)}}},
    });
}

void Server::sendNotification(std::string method, llvm::json::Value params)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"method", std::move(method)},
        {"params", std::move(params)},
    });
}

void Server::sendRequest(std::string method, llvm::json::Value params)
{
    const std::uint64_t sequence = nextOutgoingRequestId_.fetch_add(1, std::memory_order_relaxed);
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", "bicepd/" + std::to_string(sequence)},
        {"method", std::move(method)},
        {"params", std::move(params)},
    });
}

void Server::publishDiagnostics()
{
    std::unordered_set<std::string> currentUris;
    for (const DocumentSnapshot& snapshot : documents_.snapshots())
    {
        const auto context = compilations_.getCompilation(snapshot.uri);
        if (!context || !context->compilation)
        {
            continue;
        }
        llvm::json::Array payload;
        for (const Diagnostic& diagnostic : context->compilation->diagnostics)
        {
            payload.push_back(toLspDiagnostic(diagnostic, context->lineStarts));
        }
        sendNotification("textDocument/publishDiagnostics",
                         llvm::json::Object{
                             {"uri", snapshot.uri},
                             {"version", snapshot.version},
                             {"diagnostics", std::move(payload)},
                         });
        currentUris.insert(snapshot.uri);
    }

    for (const std::string& previousUri : publishedDiagnosticUris_)
    {
        if (!currentUris.contains(previousUri))
        {
            sendNotification("textDocument/publishDiagnostics",
                             llvm::json::Object{
                                 {"uri", previousUri},
                                 {"diagnostics", llvm::json::Array{}},
                             });
        }
    }
    publishedDiagnosticUris_ = std::move(currentUris);
}

void Server::reconfigure()
{
    traceLevel_.store(config_.traceLevel, std::memory_order_relaxed);
    if (auto error = compilations_.reconfigure(config_))
    {
        trace(TraceLevel::Basic, "failed to load resource types: " + llvm::toString(std::move(error)));
    }
    trace(TraceLevel::Verbose,
          "catalog has " + std::to_string(compilations_.catalog()->size()) + " resource types, trace " +
              traceLevelName(config_.traceLevel));
}

void Server::trace(const TraceLevel level, const llvm::Twine& message) const
{
    if (static_cast<int>(level) > static_cast<int>(traceLevel_.load(std::memory_order_relaxed)))
    {
        return;
    }
    llvm::errs() << "[bicepd] " << message << "\n";
}

std::string Server::requestKeyFromId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return ("s:" + text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return ("i:" + std::to_string(*integer));
    }

    std::string              serialized;
    llvm::raw_string_ostream stream(serialized);
    stream << id;
    stream.flush();
    return ("j:" + serialized);
}

void Server::shutdown()
{
    scheduler_.shutdown();
}

}  // namespace llvmbicep::lsp
