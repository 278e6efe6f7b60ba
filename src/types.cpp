/*
 * certrun - Certification Session Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "certrun/types.hpp"

namespace certrun {

const char* pluginKindToString(PluginKind kind) noexcept {
    switch (kind) {
        case PluginKind::Shell: return "shell";
        case PluginKind::Resource: return "resource";
        case PluginKind::Local: return "local";
        case PluginKind::Manual: return "manual";
        case PluginKind::UserInteract: return "user-interact";
        case PluginKind::UserVerify: return "user-verify";
        case PluginKind::UserInteractVerify: return "user-interact-verify";
        case PluginKind::Attachment: return "attachment";
    }
    return "unknown";
}

std::optional<PluginKind> pluginKindFromString(const std::string& text) noexcept {
    if (text == "shell") return PluginKind::Shell;
    if (text == "resource") return PluginKind::Resource;
    if (text == "local") return PluginKind::Local;
    if (text == "manual") return PluginKind::Manual;
    if (text == "user-interact") return PluginKind::UserInteract;
    if (text == "user-verify") return PluginKind::UserVerify;
    if (text == "user-interact-verify") return PluginKind::UserInteractVerify;
    if (text == "attachment") return PluginKind::Attachment;
    return std::nullopt;
}

const char* outcomeToString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::None: return "none";
        case Outcome::Pass: return "pass";
        case Outcome::Fail: return "fail";
        case Outcome::Skip: return "skip";
        case Outcome::Crash: return "crash";
        case Outcome::Undecided: return "undecided";
        case Outcome::NotImplemented: return "not-implemented";
        case Outcome::NotSupported: return "not-supported";
    }
    return "unknown";
}

std::optional<Outcome> outcomeFromString(const std::string& text) noexcept {
    if (text == "pass") return Outcome::Pass;
    if (text == "fail") return Outcome::Fail;
    if (text == "skip") return Outcome::Skip;
    if (text == "crash") return Outcome::Crash;
    if (text == "undecided") return Outcome::Undecided;
    if (text == "not-implemented") return Outcome::NotImplemented;
    if (text == "not-supported") return Outcome::NotSupported;
    return std::nullopt;
}

}
