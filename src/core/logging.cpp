#include "cad/core/logging.hpp"

#include <utility>

namespace cad {

logger::logger(log_sink sink, std::string prefix)
    : m_sink(std::move(sink))
    , m_prefix(std::move(prefix))
{
}

void logger::log(dpp::loglevel level, const std::string& message) const
{
    if (!m_sink) {
        return;
    }
    if (m_prefix.empty()) {
        m_sink(level, message);
    } else {
        m_sink(level, "[" + m_prefix + "] " + message);
    }
}

logger logger::with_prefix(const std::string& prefix) const
{
    return logger(m_sink, prefix);
}

} // namespace cad
