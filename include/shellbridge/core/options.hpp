/*
 * Execution options - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/core/backend.hpp>
#include <shellbridge/core/encoding.hpp>
#include <shellbridge/exec/cancellation.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace shellbridge {

struct ExecutionOptions {
    std::optional<std::chrono::milliseconds> timeout;   // engine default when unset
    std::optional<std::string> working_directory;       // inherit when unset
    std::map<std::string, std::string> extra_environment; // merged over the ambient env
    std::optional<std::string> description;             // human label, logged only
    std::optional<BackendKind> shell_override;          // forces the backend
    OutputEncoding output_encoding = OutputEncoding::Utf8;
    std::shared_ptr<CancellationToken> cancellation;    // optional
};

} // namespace shellbridge
