//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements server configuration updates from LSP messages.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/ServerConfig.h"

#include "llvm/ADT/StringSwitch.h"

namespace fabls::lsp
{
namespace
{

const llvm::json::Object* getObject(const llvm::json::Object& parent, llvm::StringRef key)
{
    const auto* value = parent.get(key);
    return value ? value->getAsObject() : nullptr;
}

void applyNesfabPath(const llvm::json::Object& settings, ServerConfig& config)
{
    if (const auto path = settings.getString("nesfabPath"))
    {
        config.nesfabDirectory = path->str();
    }
}

void applyTraceLevel(const llvm::json::Object& settings, ServerConfig& config)
{
    if (const auto rawTrace = settings.getString("trace"))
    {
        if (const std::optional<TraceLevel> level = parseTraceLevel(*rawTrace))
        {
            config.traceLevel = *level;
        }
    }
}

void applySettingsObject(const llvm::json::Object& settings, ServerConfig& config)
{
    applyNesfabPath(settings, config);
    applyTraceLevel(settings, config);
}

}  // namespace

std::optional<TraceLevel> parseTraceLevel(llvm::StringRef name)
{
    const std::string lowered = name.trim().lower();
    return llvm::StringSwitch<std::optional<TraceLevel>>(lowered)
        .Case("off", TraceLevel::Off)
        .Case("basic", TraceLevel::Basic)
        .Case("messages", TraceLevel::Basic)
        .Case("verbose", TraceLevel::Verbose)
        .Default(std::nullopt);
}

llvm::StringRef traceLevelName(const TraceLevel level)
{
    switch (level)
    {
    case TraceLevel::Off:
        return "off";
    case TraceLevel::Basic:
        return "basic";
    case TraceLevel::Verbose:
        return "verbose";
    }
    return "basic";
}

bool applyInitializationOptions(const llvm::json::Value& options, ServerConfig& config)
{
    const auto* object = options.getAsObject();
    if (!object)
    {
        return false;
    }
    applySettingsObject(*object, config);
    return true;
}

bool applyDidChangeConfiguration(const llvm::json::Value& params, ServerConfig& config)
{
    const auto* paramsObject = params.getAsObject();
    if (!paramsObject)
    {
        return false;
    }
    const auto* settings = getObject(*paramsObject, "settings");
    if (!settings)
    {
        return false;
    }

    if (const auto* scoped = getObject(*settings, "fabls"))
    {
        applySettingsObject(*scoped, config);
    }
    else
    {
        applySettingsObject(*settings, config);
    }
    return true;
}

}  // namespace fabls::lsp
