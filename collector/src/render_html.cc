#include "render.h"

#include <set>
#include <sstream>
#include <vector>

namespace hosthealth {

using json = nlohmann::json;

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

// Display text for one value: arrays joined with ", ", objects compacted.
static std::string cell_text(const json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return v.get<std::string>();
    if (v.is_array()) {
        std::string out;
        for (size_t i = 0; i < v.size(); i++) {
            if (i) out += ", ";
            out += cell_text(v[i]);
        }
        return out;
    }
    return v.dump(-1, ' ', false, json::error_handler_t::replace);
}

static const char* kStyle =
    "body{font-family:Segoe UI,Helvetica,Arial,sans-serif;margin:24px;color:#222}"
    "h1{font-size:20px;margin-bottom:4px}"
    ".generated{color:#666;font-size:12px;margin-bottom:16px}"
    ".section{border:1px solid #ccc;border-radius:6px;padding:10px 14px;margin-bottom:14px}"
    ".section h2{font-size:16px;margin:0 0 8px 0}"
    ".sev-info{background:#f5f5f5}"
    ".sev-warn{background:#fff3cd;border-color:#e0a800}"
    ".sev-error{background:#f8d7da;border-color:#c82333}"
    "table{border-collapse:collapse;font-size:13px}"
    "th,td{border:1px solid #ddd;padding:3px 8px;text-align:left;vertical-align:top}"
    "th{background:rgba(0,0,0,0.05)}";

// Scalar-map payloads (System, CPU, Memory, a failure or a disk marker).
static void render_key_value(std::ostringstream& o, const json& obj) {
    o << "<table>\n";
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        o << "<tr><th>" << html_escape(it.key()) << "</th><td>"
          << html_escape(cell_text(it.value())) << "</td></tr>\n";
    }
    o << "</table>\n";
}

// Map-of-maps payloads (Volumes, Physical Disks): one row per entity.
static void render_entity_table(std::ostringstream& o, const json& obj,
                                const std::string& key_header,
                                const std::vector<std::string>& preferred_columns) {
    if (obj.empty()) {
        o << "<p>None</p>\n";
        return;
    }

    std::vector<std::string> columns = preferred_columns;
    std::set<std::string> known(columns.begin(), columns.end());
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().is_object()) continue;
        for (auto c = it.value().begin(); c != it.value().end(); ++c) {
            if (known.insert(c.key()).second) columns.push_back(c.key());
        }
    }

    o << "<table>\n<tr><th>" << html_escape(key_header) << "</th>";
    for (const auto& c : columns) o << "<th>" << html_escape(c) << "</th>";
    o << "</tr>\n";

    for (auto it = obj.begin(); it != obj.end(); ++it) {
        o << "<tr><td>" << html_escape(it.key()) << "</td>";
        for (const auto& c : columns) {
            std::string text;
            if (it.value().is_object() && it.value().contains(c)) text = cell_text(it.value()[c]);
            o << "<td>" << html_escape(text) << "</td>";
        }
        o << "</tr>\n";
    }
    o << "</table>\n";
}

static void render_section_body(std::ostringstream& o, const Section& s) {
    const json data = section_data_to_json(s.data);

    if (std::holds_alternative<ProbeFailure>(s.data)) {
        render_key_value(o, data);
        return;
    }

    switch (s.kind) {
        case SectionKind::System:
        case SectionKind::Cpu:
        case SectionKind::Memory:
            render_key_value(o, data);
            return;

        case SectionKind::Volumes:
            render_entity_table(o, data, "Volume",
                                {"TotalGB", "UsedGB", "FreeGB", "UsedPct", "FreePct", "Status"});
            return;

        case SectionKind::PhysicalDisks: {
            const auto* pd = std::get_if<PhysicalDiskReport>(&s.data);
            if (pd && pd->state != PhysicalDiskReport::State::Devices) {
                o << "<p>" << html_escape(pd->message) << "</p>\n";
                return;
            }
            render_entity_table(o, data, "Disk",
                                {"HealthStatus", "OperationalStatus", "MediaType", "SizeGB"});
            return;
        }
    }
}

std::string render_html(const Report& r) {
    std::ostringstream o;
    o << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n"
      << "<title>Host Health Report</title>\n<style>" << kStyle << "</style>\n</head>\n<body>\n"
      << "<h1>Host Health Report</h1>\n"
      << "<div class=\"generated\">Generated " << html_escape(r.generated_at) << "</div>\n";

    for (const auto& s : r.sections) {
        o << "<div class=\"section sev-" << severity_str(s.severity) << "\">\n"
          << "<h2>" << html_escape(s.title) << "</h2>\n";
        render_section_body(o, s);
        o << "</div>\n";
    }

    o << "</body>\n</html>\n";
    return o.str();
}

} // namespace hosthealth
