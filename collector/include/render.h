#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "report.h"

namespace hosthealth {

    // { "GeneratedAt": ..., "Sections": [ { "Title", "Data", "Severity" } ] }
    nlohmann::json report_to_json(const Report& r);

    // Data payload of one Section, with the key names of the JSON contract.
    nlohmann::json section_data_to_json(const SectionData& d);

    // Pretty-printed (2-space indent) report_to_json(). Invalid UTF-8 in any
    // string is replaced with U+FFFD, never an exception.
    std::string render_json(const Report& r);

    // Self-contained HTML document, one block per Section, shaded by severity.
    std::string render_html(const Report& r);

    std::string html_escape(const std::string& s);

} // namespace hosthealth
