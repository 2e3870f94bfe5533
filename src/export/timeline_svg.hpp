#pragma once

#include "export/atomic_file.hpp"
#include "schedule/person_colors.hpp"
#include "schedule/timeline_layout.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TimelineStyle - pixel geometry of the rendered chart
// ---------------------------------------------------------------------------
struct TimelineStyle {
    int column_width = 90;
    int hour_height = 60;
    int margin_left = 70;
    int title_height = 60;
    int date_label_height = 40;
    int legend_width = 180;
    int legend_row_height = 20;
    double bar_fraction = 0.8;  // share of the column a shift box occupies
};

// ---------------------------------------------------------------------------
// TimelineSvgRenderer - shift boxes per day, earlier hours at the top
// ---------------------------------------------------------------------------
class TimelineSvgRenderer {
public:
    TimelineSvgRenderer() = default;
    explicit TimelineSvgRenderer(const TimelineStyle& style) : style_(style) {}

    int width(const TimelineLayout& layout) const {
        return style_.margin_left + layout.num_slots() * style_.column_width + style_.legend_width;
    }

    int height(const TimelineLayout& layout) const {
        int hours = layout.max_hour - layout.min_hour;
        return chart_top() + hours * style_.hour_height + 20;
    }

    double y_for(const TimelineLayout& layout, double hour) const {
        return chart_top() + (hour - layout.min_hour) * style_.hour_height;
    }

    double x_center(int slot) const {
        return style_.margin_left + (slot + 0.5) * style_.column_width;
    }

    void render(std::ostream& out, const TimelineLayout& layout, const PersonColorMap& colors,
                const std::string& title, const std::string& subtitle) const {
        const int w = width(layout);
        const int h = height(layout);
        const int chart_right = style_.margin_left + layout.num_slots() * style_.column_width;

        out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << w << "\" height=\"" << h
            << "\" viewBox=\"0 0 " << w << " " << h << "\" font-family=\"sans-serif\">\n";
        out << "<rect x=\"0\" y=\"0\" width=\"" << w << "\" height=\"" << h
            << "\" fill=\"#FFFFFF\"/>\n";

        // Title
        out << "<text x=\"" << chart_right / 2 << "\" y=\"24\" text-anchor=\"middle\" "
            << "font-size=\"16\" font-weight=\"bold\">" << escape(title) << "</text>\n";
        out << "<text x=\"" << chart_right / 2 << "\" y=\"44\" text-anchor=\"middle\" "
            << "font-size=\"12\">" << escape(subtitle) << "</text>\n";

        // Hour grid
        for (int hour = layout.min_hour; hour <= layout.max_hour; ++hour) {
            double y = y_for(layout, hour);
            out << "<line x1=\"" << style_.margin_left << "\" y1=\"" << fmt(y)
                << "\" x2=\"" << chart_right << "\" y2=\"" << fmt(y)
                << "\" stroke=\"#BBBBBB\" stroke-dasharray=\"4,4\"/>\n";
            if (hour < layout.max_hour) {
                char label[8];
                std::snprintf(label, sizeof(label), "%02d:00", hour);
                out << "<text x=\"" << style_.margin_left - 8 << "\" y=\"" << fmt(y + 4)
                    << "\" text-anchor=\"end\" font-size=\"11\">" << label << "</text>\n";
            }
        }

        // Shift boxes
        const double bar_w = style_.column_width * style_.bar_fraction;
        for (const auto& slot : layout.slots) {
            double cx = x_center(slot.x);

            out << "<text x=\"" << fmt(cx) << "\" y=\"" << style_.title_height + 14
                << "\" text-anchor=\"middle\" font-size=\"10\" font-weight=\"bold\">"
                << time_utils::format_date(slot.date) << "</text>\n";
            out << "<text x=\"" << fmt(cx) << "\" y=\"" << style_.title_height + 28
                << "\" text-anchor=\"middle\" font-size=\"10\">"
                << time_utils::weekday_abbrev(slot.date) << "</text>\n";

            for (const auto& box : slot.boxes) {
                double y0 = y_for(layout, box.y_start);
                double y1 = y_for(layout, box.y_end);
                out << "<rect x=\"" << fmt(cx - bar_w / 2) << "\" y=\"" << fmt(y0)
                    << "\" width=\"" << fmt(bar_w) << "\" height=\"" << fmt(y1 - y0)
                    << "\" fill=\"#" << colors.color_for(box.person)
                    << "\" stroke=\"#000000\" stroke-width=\"1\"/>\n";
                out << "<text x=\"" << fmt(cx) << "\" y=\"" << fmt((y0 + y1) / 2 + 3)
                    << "\" text-anchor=\"middle\" font-size=\"9\" font-weight=\"bold\">"
                    << escape(box.person) << "</text>\n";
            }
        }

        // Legend, sorted by name
        std::vector<std::pair<std::string, std::string>> legend(colors.begin(), colors.end());
        std::sort(legend.begin(), legend.end());
        const int lx = chart_right + 20;
        int ly = chart_top();
        out << "<text x=\"" << lx << "\" y=\"" << ly - 8
            << "\" font-size=\"12\" font-weight=\"bold\">Team Members</text>\n";
        for (const auto& [person, color] : legend) {
            out << "<rect x=\"" << lx << "\" y=\"" << ly << "\" width=\"14\" height=\"14\" "
                << "fill=\"#" << color << "\" stroke=\"#000000\"/>\n";
            out << "<text x=\"" << lx + 20 << "\" y=\"" << ly + 11 << "\" font-size=\"11\">"
                << escape(person) << "</text>\n";
            ly += style_.legend_row_height;
        }

        out << "</svg>\n";
    }

    // Returns false (and writes nothing) when the layout is empty.
    bool render_file(const std::string& path, const TimelineLayout& layout,
                     const PersonColorMap& colors, const std::string& title,
                     const std::string& subtitle) const {
        if (layout.empty()) return false;
        schedule_io::write_file_atomically(path, [&](std::ostream& out) {
            render(out, layout, colors, title, subtitle);
        });
        return true;
    }

    static std::string escape(const std::string& s) {
        std::string out;
        for (char c : s) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                default:  out += c;
            }
        }
        return out;
    }

private:
    TimelineStyle style_;

    int chart_top() const { return style_.title_height + style_.date_label_height; }

    static std::string fmt(double v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", v);
        return buf;
    }
};
