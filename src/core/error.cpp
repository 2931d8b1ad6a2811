/// @file error.cpp
/// @brief Error chain formatting and the common Result instantiations

#include <planar/core/error.hpp>

#include <sstream>

namespace planar_core {

const char* config_error_kind_name(ConfigError::Kind kind) {
    switch (kind) {
        case ConfigError::Kind::FileNotFound: return "FileNotFound";
        case ConfigError::Kind::ParseFailed: return "ParseFailed";
        case ConfigError::Kind::InvalidValue: return "InvalidValue";
    }
    return "Unknown";
}

std::string build_error_chain(const Error& error) {
    std::ostringstream out;
    out << '[' << error_code_name(error.code()) << "] ";

    if (const ConfigError* detail = error.config()) {
        out << "[ConfigError:" << config_error_kind_name(detail->kind) << "] " << detail->message;
        if (!detail->key.empty()) {
            out << " (key: " << detail->key << ')';
        }
    } else {
        out << error.message();
    }

    const auto& context = error.context();
    for (std::size_t i = 0; i < context.size(); ++i) {
        out << (i == 0 ? " (" : ", ") << context[i].first << '=' << context[i].second;
    }
    if (!context.empty()) {
        out << ')';
    }
    return out.str();
}

template class Result<void, Error>;
template class Result<bool, Error>;

} // namespace planar_core
