// path_filter.cpp - Glob path patterns and ChangeSet filtering

#include <semdiff/path_filter.h>

#include <algorithm>

namespace semdiff {

// ============================================================
// PathPattern
// ============================================================

PathPattern PathPattern::parse(std::string_view text)
{
    if (text.empty()) {
        throw PatternError(std::string{text}, "pattern is empty");
    }

    PathPattern pattern;
    pattern.text_ = std::string{text};

    std::size_t start = 0;
    while (true) {
        const auto pos = text.find('.', start);
        const auto seg = text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);

        if (seg.empty()) {
            throw PatternError(pattern.text_, "empty segment");
        }

        const auto stars = static_cast<std::size_t>(std::count(seg.begin(), seg.end(), '*'));
        if (stars == 0) {
            pattern.segments_.push_back(Segment{Segment::Kind::Literal, std::string{seg}});
        } else if (stars != seg.size()) {
            throw PatternError(pattern.text_, "'*' mixed with other characters in segment '"
                                                  + std::string{seg} + "'");
        } else if (stars == 1) {
            pattern.segments_.push_back(Segment{Segment::Kind::AnyOne, {}});
        } else if (stars == 2) {
            pattern.segments_.push_back(Segment{Segment::Kind::AnyMany, {}});
        } else {
            throw PatternError(pattern.text_, "too many '*' in segment '" + std::string{seg} + "'");
        }

        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }

    return pattern;
}

bool PathPattern::matches(const Path& path) const
{
    // Wildcard matching with backtracking to the most recent '**'
    std::size_t p = 0;
    std::size_t s = 0;
    std::size_t star_p = segments_.size();
    std::size_t star_s = 0;

    while (s < path.size()) {
        if (p < segments_.size()) {
            const auto& seg = segments_[p];
            if (seg.kind == Segment::Kind::AnyMany) {
                star_p = p++;
                star_s = s;
                continue;
            }
            if (seg.kind == Segment::Kind::AnyOne || seg.text == path.segment_string(s)) {
                ++p;
                ++s;
                continue;
            }
        }
        if (star_p == segments_.size()) {
            return false;
        }
        // Let the last '**' swallow one more segment
        p = star_p + 1;
        s = ++star_s;
    }

    // Remaining pattern may only consist of '**'
    while (p < segments_.size() && segments_[p].kind == Segment::Kind::AnyMany) {
        ++p;
    }
    return p == segments_.size();
}

// ============================================================
// FilterConfig
// ============================================================

FilterConfig& FilterConfig::ignore(std::string_view pattern)
{
    ignore_.push_back(PathPattern::parse(pattern));
    return *this;
}

FilterConfig& FilterConfig::only(std::string_view pattern)
{
    only_.push_back(PathPattern::parse(pattern));
    return *this;
}

bool FilterConfig::should_include(const Path& path) const
{
    auto matches = [&path](const PathPattern& p) { return p.matches(path); };

    if (std::ranges::any_of(ignore_, matches)) {
        return false;
    }
    return only_.empty() || std::ranges::any_of(only_, matches);
}

ChangeSet filter_changes(const ChangeSet& changes, const FilterConfig& filter)
{
    if (!filter.has_filters()) {
        return changes;
    }

    ChangeSet result;
    for (const auto& change : changes) {
        if (filter.should_include(change.path)) {
            result.push_back(change);
        }
    }
    return result;
}

} // namespace semdiff
