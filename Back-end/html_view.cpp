#include "html_view.hpp"

#include <sstream>

namespace {

const char* const PAGE_HEAD = R"(<!doctype html>
<html>
<head>
  <meta charset="utf-8"/>
  <title>Auto Schedule Builder</title>
  <style>
    body{font-family:system-ui, sans-serif;max-width:720px;margin:40px auto;padding:0 1rem}
    label{display:block;margin-top:1rem;font-weight:600}
    input,button{width:100%;padding:.5rem;font-size:1rem}
    button{margin-top:1.25rem;cursor:pointer;border:none;border-radius:.5rem;background:#d62828;color:#fff}
    pre{background:#f7f7f7;padding:1rem;border-radius:.5rem;white-space:pre-line}
    h2{margin-top:2rem;color:#333}
    .error{color:#d62828}
  </style>
</head>
<body>
  <h1>Auto Schedule Builder</h1>
)";

std::string block_text(const TimeBlock& block) {
    return format_days(block.days()) + "  " + format_hhmm(block.start()) + "-" + format_hhmm(block.end());
}

}  // namespace

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string format_schedule_text(const Schedule& schedule) {
    std::ostringstream out;
    for (size_t i = 0; i < schedule.size(); ++i) {
        const Section& section = *schedule[i].section;
        if (i > 0) out << "\n";
        out << schedule[i].course->course_id << "  CRN:" << section.section_id;
        if (section.blocks.empty()) {
            out << "  (no meetings)";
        }
        for (size_t b = 0; b < section.blocks.size(); ++b) {
            out << (b == 0 ? "  " : "; ") << block_text(section.blocks[b]);
        }
    }
    return out.str();
}

std::string render_page(const FormValues& form, const PageResult* result) {
    std::ostringstream html;
    html << PAGE_HEAD;

    html << "  <form method=\"post\">\n"
         << "    <label>Courses (space-separated)</label>\n"
         << "    <input name=\"courses\" placeholder=\"CS280 CS241 MATH333\" value=\""
         << html_escape(form.courses) << "\" required>\n"
         << "    <label>Earliest start (HH:MM)</label>\n"
         << "    <input type=\"time\" name=\"start\" value=\"" << html_escape(form.start) << "\" required>\n"
         << "    <label>Latest finish (HH:MM)</label>\n"
         << "    <input type=\"time\" name=\"end\" value=\"" << html_escape(form.end) << "\" required>\n"
         << "    <label>Days allowed (e.g. MTWRF)</label>\n"
         << "    <input name=\"days\" value=\"" << html_escape(form.days) << "\" required>\n"
         << "    <button type=\"submit\">Find schedules</button>\n"
         << "  </form>\n";

    if (result != nullptr) {
        if (!result->error.empty()) {
            html << "  <p class=\"error\">" << html_escape(result->error) << "</p>\n";
        } else {
            html << "  <h2>" << result->schedules.size() << " schedule(s) found";
            if (result->truncated) {
                html << " (showing first " << result->cap << ")";
            }
            if (result->timed_out) {
                html << " (search stopped early)";
            }
            html << "</h2>\n";

            if (result->schedules.empty()) {
                html << "  <p><em>No schedule fits those constraints.</em></p>\n";
            }
            for (size_t i = 0; i < result->schedules.size(); ++i) {
                html << "  <pre><strong>Schedule #" << (i + 1) << "</strong>\n"
                     << html_escape(result->schedules[i]) << "</pre>\n";
            }
        }
    }

    html << "</body>\n</html>\n";
    return html.str();
}
