#pragma once

#include <functional>
#include <string>

#include <dpp/misc-enum.h>

namespace cad {

using log_sink = std::function<void(dpp::loglevel, const std::string&)>;

/// Thin handle around a log sink. The bot binds it to dpp::cluster::log,
/// tests bind it to a vector or leave it empty.
class logger {
public:
    logger() = default;
    explicit logger(log_sink sink, std::string prefix = {});

    void log(dpp::loglevel level, const std::string& message) const;

    // Same sink, different "[prefix] " on every line.
    logger with_prefix(const std::string& prefix) const;

private:
    log_sink    m_sink;
    std::string m_prefix;
};

} // namespace cad
