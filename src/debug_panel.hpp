#pragma once
#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel — provider registry for the F3 overlay.
//
// Stored as a World resource. Modules register at startup:
//   watch(section, label, fn[, highlight])  a text row; the value is drawn
//                                           in the accent colour while
//                                           highlight() is true
//   strip(section, label, fn)               a 1D field gauge: the track, an
//                                           occupied span and an optional
//                                           marker
// DebugSystem polls every provider each render frame. No raylib dependency.
// ---------------------------------------------------------------------------

// One sample of a field gauge, in world units.
struct StripValue {
    float                lo      = 0.0f;
    float                hi      = 1.0f;
    float                span_lo = 0.0f;
    float                span_hi = 0.0f;
    std::optional<float> marker;

    // Position of v along the track as a fraction in [0, 1].
    float fraction(float v) const {
        if (hi <= lo) return 0.0f;
        return std::clamp((v - lo) / (hi - lo), 0.0f, 1.0f);
    }
};

struct DebugPanel {
    using Provider      = std::function<std::string()>;
    using Highlight     = std::function<bool()>;
    using StripProvider = std::function<StripValue()>;

    struct Row {
        std::string label;
        Provider    fn;
        Highlight   highlight;
    };

    struct Strip {
        std::string   label;
        StripProvider fn;
    };

    struct Section {
        std::string        title;
        std::vector<Row>   rows;
        std::vector<Strip> strips;
    };

    // Pixel sizes DebugSystem lays the panel out with.
    struct Metrics {
        int pad       = 8;
        int row_h     = 15;
        int strip_h   = 22;
        int separator = 4;
    };

    bool visible = false;

    // A label already present in the section has its provider replaced.
    void watch(const std::string& section, const std::string& label,
               Provider fn, Highlight highlight = {}) {
        auto& rows = section_named(section).rows;
        for (auto& r : rows) {
            if (r.label == label) {
                r.fn        = std::move(fn);
                r.highlight = std::move(highlight);
                return;
            }
        }
        rows.push_back({label, std::move(fn), std::move(highlight)});
    }

    void strip(const std::string& section, const std::string& label, StripProvider fn) {
        auto& strips = section_named(section).strips;
        for (auto& s : strips) {
            if (s.label == label) {
                s.fn = std::move(fn);
                return;
            }
        }
        strips.push_back({label, std::move(fn)});
    }

    // Header + text rows across all sections. Strips are not text lines.
    int line_count() const {
        int n = 0;
        for (const auto& s : sections_) n += 1 + static_cast<int>(s.rows.size());
        return n;
    }

    int strip_count() const {
        int n = 0;
        for (const auto& s : sections_) n += static_cast<int>(s.strips.size());
        return n;
    }

    // Title line, then per section: separator, header, rows, strips.
    int height(const Metrics& m) const {
        return m.pad + m.row_h + m.pad
             + line_count() * m.row_h
             + static_cast<int>(sections_.size()) * m.separator
             + strip_count() * m.strip_h
             + m.pad;
    }

    const std::vector<Section>& sections() const { return sections_; }

private:
    Section& section_named(const std::string& title) {
        for (auto& s : sections_) {
            if (s.title == title) return s;
        }
        sections_.push_back({title, {}, {}});
        return sections_.back();
    }

    std::vector<Section> sections_;
};
