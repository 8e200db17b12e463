//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framed JSON-RPC stream transport.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/LSP/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <ostream>
#include <string>

namespace llvmbicep::lsp
{
namespace
{

/// Header names are case-insensitive; other headers (`Content-Type`) are ignored.
std::optional<std::size_t> parseContentLengthHeader(llvm::StringRef line)
{
    const auto colon = line.find(':');
    if (colon == llvm::StringRef::npos || !line.substr(0, colon).trim().equals_insensitive("Content-Length"))
    {
        return std::nullopt;
    }
    std::size_t value = 0;
    if (line.substr(colon + 1).trim().getAsInteger(10, value))
    {
        return std::nullopt;
    }
    return value;
}

}  // namespace

JsonRpcStdioTransport::JsonRpcStdioTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

llvm::Expected<std::optional<llvm::json::Value>> JsonRpcStdioTransport::readMessage()
{
    std::optional<std::size_t> contentLength;
    bool                       hasHeaders = false;
    std::string                line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            if (hasHeaders)
            {
                break;
            }
            continue;
        }

        hasHeaders = true;
        if (const auto parsedLength = parseContentLengthHeader(line))
        {
            contentLength = parsedLength;
        }
    }

    if (!hasHeaders)
    {
        return std::nullopt;
    }

    if (!contentLength || *contentLength == 0U)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "missing Content-Length header");
    }

    std::string payload(*contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(*contentLength));
    if (input_.gcount() != static_cast<std::streamsize>(*contentLength))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "truncated JSON-RPC payload");
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid JSON payload: %s",
                                       llvm::toString(parsed.takeError()).c_str());
    }
    return std::optional<llvm::json::Value>(std::move(*parsed));
}

llvm::Error JsonRpcStdioTransport::writeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::lock_guard<std::mutex> lock(writeMutex_);
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    output_.flush();
    if (!output_)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "failed to write JSON-RPC message");
    }
    return llvm::Error::success();
}

}  // namespace llvmbicep::lsp
