// value_diff.h - Structural diff of two Value trees

#pragma once

#include <semdiff/api.h>
#include <semdiff/array_align.h>
#include <semdiff/path.h>
#include <semdiff/value.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace semdiff {

enum class ChangeType : std::uint8_t { Added, Removed, Modified, Unchanged };

/// Lower-case name ("added", "removed", "modified", "unchanged")
[[nodiscard]] SEMDIFF_API std::string_view to_string(ChangeType type) noexcept;

struct Change {
    ChangeType type;
    Path path;              // Location of the change
    ValueBox old_value;     // Meaningful for Removed, Modified and Unchanged
    ValueBox new_value;     // Meaningful for Added, Modified and Unchanged

    // Boxes are shared with the compared trees; no deep copy is made.
    Change(ChangeType t, Path p, ValueBox old_box, ValueBox new_box)
        : type(t), path(std::move(p)), old_value(std::move(old_box)), new_value(std::move(new_box)) {}

    static Change added(Path p, ValueBox value) {
        return Change{ChangeType::Added, std::move(p), ValueBox{}, std::move(value)};
    }
    static Change removed(Path p, ValueBox value) {
        return Change{ChangeType::Removed, std::move(p), std::move(value), ValueBox{}};
    }
    static Change modified(Path p, ValueBox old_box, ValueBox new_box) {
        return Change{ChangeType::Modified, std::move(p), std::move(old_box), std::move(new_box)};
    }
    static Change unchanged(Path p, ValueBox value) {
        auto copy = value;
        return Change{ChangeType::Unchanged, std::move(p), std::move(copy), std::move(value)};
    }

    [[nodiscard]] bool has_old() const noexcept { return type != ChangeType::Added; }
    [[nodiscard]] bool has_new() const noexcept { return type != ChangeType::Removed; }

    /// The value that was added/removed/changed
    /// For Removed: returns old_value, otherwise new_value
    [[nodiscard]] const Value& value() const {
        return (type == ChangeType::Removed) ? *old_value : *new_value;
    }

    [[nodiscard]] const Value& get_old() const { return *old_value; }
    [[nodiscard]] const Value& get_new() const { return *new_value; }
};

struct DiffStats {
    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t modified = 0;
    std::size_t unchanged = 0;

    /// Added + removed + modified
    [[nodiscard]] std::size_t total_changes() const noexcept { return added + removed + modified; }
    [[nodiscard]] bool is_empty() const noexcept { return total_changes() == 0; }

    void count(ChangeType type) noexcept;

    bool operator==(const DiffStats&) const = default;
};

// ============================================================
// ChangeSet - ordered changes plus aggregate counts
// ============================================================

class SEMDIFF_API ChangeSet {
public:
    using const_iterator = std::vector<Change>::const_iterator;

    ChangeSet() = default;
    explicit ChangeSet(std::vector<Change> changes);

    /// Append a change and update the counts
    void push_back(Change change);

    [[nodiscard]] const std::vector<Change>& changes() const noexcept { return changes_; }
    [[nodiscard]] const DiffStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const_iterator begin() const noexcept { return changes_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return changes_.end(); }
    [[nodiscard]] std::size_t size() const noexcept { return changes_.size(); }
    [[nodiscard]] const Change& operator[](std::size_t i) const { return changes_[i]; }

    /// True iff there are no Added, Removed or Modified entries
    [[nodiscard]] bool is_empty() const noexcept { return stats_.is_empty(); }
    [[nodiscard]] std::size_t total_changes() const noexcept { return stats_.total_changes(); }

private:
    std::vector<Change> changes_;
    DiffStats stats_;
};

// ============================================================
// DiffConfig
// ============================================================

struct DiffConfig {
    /// Suppress Unchanged entries
    bool compact = true;
    /// Object keys holding Null count as absent
    bool null_as_missing = false;
    /// Collapse whitespace runs in strings before comparing
    bool ignore_whitespace = false;
    ArrayStrategy array_strategy = ArrayStrategy::Positional;

    [[nodiscard]] Equivalence equivalence() const noexcept {
        return Equivalence{ignore_whitespace, null_as_missing};
    }
};

// ============================================================
// DiffEngine - recursive comparison of two Value trees
//
// Walks both trees in pre-order. Objects are merged by key (old-side
// order, then new-only keys), arrays go through align_arrays(), and
// anything else is compared as a leaf. A whole container shows up in a
// change only when it is itself added, removed, or replaced by a value
// of another kind.
// ============================================================

class SEMDIFF_API DiffEngine {
public:
    explicit DiffEngine(const DiffConfig& config) : config_(config), eq_(config.equivalence()) {}

    [[nodiscard]] ChangeSet diff(const Value& old_val, const Value& new_val);

private:
    void diff_value(const ValueBox& old_box, const ValueBox& new_box, Path& current_path);
    void diff_object(const ValueObject& old_obj, const ValueObject& new_obj, Path& current_path);
    void diff_array(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path);
    [[nodiscard]] bool is_present(const ValueBox* box) const noexcept;

    DiffConfig config_;
    Equivalence eq_;
    ChangeSet result_;
};

/// Compute the changes turning @p old_val into @p new_val
[[nodiscard]] SEMDIFF_API ChangeSet compute_diff(const Value& old_val, const Value& new_val,
                                                 const DiffConfig& config = {});

} // namespace semdiff
