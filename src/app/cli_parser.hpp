#pragma once
#include <functional>
#include <optional>
#include <string>
#include "protocol/proxy_config.hpp"
#include "core/errors/proxy_errors.hpp"

namespace acptrace::app::cli {
    // Environment lookup seam; the default reads the process environment.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    std::optional<std::string> process_env(const std::string& name);

    acptrace::core::errors::Result<acptrace::protocol::ProxyConfig> parse_and_validate(
        int argc, char* argv[], const EnvLookup& env = process_env);

    std::string usage();
}
