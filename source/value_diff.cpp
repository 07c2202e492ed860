// value_diff.cpp - DiffEngine and ChangeSet

#include <semdiff/value_diff.h>

namespace semdiff {

std::string_view to_string(ChangeType type) noexcept
{
    switch (type) {
        case ChangeType::Added:     return "added";
        case ChangeType::Removed:   return "removed";
        case ChangeType::Modified:  return "modified";
        case ChangeType::Unchanged: return "unchanged";
    }
    return "unknown";
}

void DiffStats::count(ChangeType type) noexcept
{
    switch (type) {
        case ChangeType::Added:     ++added; break;
        case ChangeType::Removed:   ++removed; break;
        case ChangeType::Modified:  ++modified; break;
        case ChangeType::Unchanged: ++unchanged; break;
    }
}

// ============================================================
// ChangeSet
// ============================================================

ChangeSet::ChangeSet(std::vector<Change> changes)
    : changes_(std::move(changes))
{
    for (const auto& c : changes_) {
        stats_.count(c.type);
    }
}

void ChangeSet::push_back(Change change)
{
    stats_.count(change.type);
    changes_.push_back(std::move(change));
}

// ============================================================
// DiffEngine
// ============================================================

ChangeSet DiffEngine::diff(const Value& old_val, const Value& new_val)
{
    result_ = ChangeSet{};

    // Same object compared to itself
    if (config_.compact && &old_val == &new_val) {
        return std::move(result_);
    }

    Path root_path;
    root_path.reserve(16);
    diff_value(ValueBox{old_val}, ValueBox{new_val}, root_path);
    return std::move(result_);
}

bool DiffEngine::is_present(const ValueBox* box) const noexcept
{
    if (!box) return false;
    return !(config_.null_as_missing && box->get().is_null());
}

void DiffEngine::diff_value(const ValueBox& old_box, const ValueBox& new_box, Path& current_path)
{
    const Value& old_val = old_box.get();
    const Value& new_val = new_box.get();

    // Shared sub-tree: nothing below can differ
    if (config_.compact && &old_val == &new_val) [[likely]] {
        return;
    }

    if (old_val.data.index() != new_val.data.index()) [[unlikely]] {
        result_.push_back(Change::modified(current_path, old_box, new_box));
        return;
    }

    std::visit([&](const auto& old_arg) {
        using T = std::decay_t<decltype(old_arg)>;

        if constexpr (std::is_same_v<T, ValueObject>) {
            diff_object(old_arg, std::get<ValueObject>(new_val.data), current_path);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            diff_array(old_arg, std::get<ValueVector>(new_val.data), current_path);
        } else {
            if (equivalent(old_val, new_val, eq_)) {
                if (!config_.compact) {
                    result_.push_back(Change::unchanged(current_path, new_box));
                }
            } else {
                result_.push_back(Change::modified(current_path, old_box, new_box));
            }
        }
    }, old_val.data);
}

void DiffEngine::diff_object(const ValueObject& old_obj, const ValueObject& new_obj, Path& current_path)
{
    // Keys in old-side order first
    for (const auto& entry : old_obj) {
        const ValueBox* new_box = new_obj.find_box(entry.key);
        const bool in_old = is_present(&entry.value);
        const bool in_new = is_present(new_box);

        current_path.push_back(entry.key);
        if (in_old && in_new) {
            diff_value(entry.value, *new_box, current_path);
        } else if (in_old) {
            result_.push_back(Change::removed(current_path, entry.value));
        } else if (in_new) {
            result_.push_back(Change::added(current_path, *new_box));
        }
        current_path.pop_back();
    }

    // Then keys only the new side has, in new-side order
    for (const auto& entry : new_obj) {
        if (old_obj.contains(entry.key) || !is_present(&entry.value)) {
            continue;
        }
        current_path.push_back(entry.key);
        result_.push_back(Change::added(current_path, entry.value));
        current_path.pop_back();
    }
}

void DiffEngine::diff_array(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path)
{
    const auto alignment = align_arrays(old_vec, new_vec, config_.array_strategy, eq_);

    for (const auto& step : alignment) {
        if (step.is_match()) {
            // Matched pairs are addressed by their new-side index
            current_path.push_back(*step.new_index);
            diff_value(old_vec[*step.old_index], new_vec[*step.new_index], current_path);
        } else if (step.is_removal()) {
            current_path.push_back(*step.old_index);
            result_.push_back(Change::removed(current_path, old_vec[*step.old_index]));
        } else {
            current_path.push_back(*step.new_index);
            result_.push_back(Change::added(current_path, new_vec[*step.new_index]));
        }
        current_path.pop_back();
    }
}

ChangeSet compute_diff(const Value& old_val, const Value& new_val, const DiffConfig& config)
{
    DiffEngine engine{config};
    return engine.diff(old_val, new_val);
}

} // namespace semdiff
