#pragma once

#include <string>
#include <string_view>

#include <CLI/CLI.hpp>


namespace umadb::examples::cli {

// -------------------------------------------------------------
// Store URL validator
// -------------------------------------------------------------
inline auto store_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0) {
            return {};
        }
        return "URL must start with http:// or https://";
    },
    "Store URL validator"
);


// -------------------------------------------------------------
// Tag validator
// -------------------------------------------------------------
inline auto tag_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (!value.empty()) {
            return {};
        }
        return "Tag must not be empty";
    },
    "Tag validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember(
    {"trace", "debug", "info", "warn", "error", "fatal", "off"}
);

} // namespace umadb::examples::cli
