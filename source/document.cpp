// document.cpp - Document graph and Value tree resolution

#include <semdiff/document.h>
#include <semdiff/builders.h>
#include <semdiff/path.h>

#include <unordered_map>

namespace semdiff {

// ============================================================
// Document - node creation
// ============================================================

NodeId Document::add_node(DocumentNode node)
{
    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

NodeId Document::add_null()
{
    return add_node(DocumentNode{});
}

NodeId Document::add_bool(bool value)
{
    DocumentNode node;
    node.kind = ValueKind::Bool;
    node.boolean = value;
    return add_node(std::move(node));
}

NodeId Document::add_number(double value)
{
    DocumentNode node;
    node.kind = ValueKind::Number;
    node.number = value;
    return add_node(std::move(node));
}

NodeId Document::add_string(std::string value)
{
    DocumentNode node;
    node.kind = ValueKind::String;
    node.text = std::move(value);
    return add_node(std::move(node));
}

NodeId Document::add_array()
{
    DocumentNode node;
    node.kind = ValueKind::Array;
    return add_node(std::move(node));
}

NodeId Document::add_object()
{
    DocumentNode node;
    node.kind = ValueKind::Object;
    return add_node(std::move(node));
}

DocumentNode& Document::mutable_node(NodeId id, ValueKind expected, const char* func)
{
    auto& node = nodes_.at(id);
    if (node.kind != expected) {
        throw std::invalid_argument(std::string{func} + ": node " + std::to_string(id) + " is "
                                    + std::string{kind_name(node.kind)} + ", expected "
                                    + std::string{kind_name(expected)});
    }
    return node;
}

void Document::append(NodeId array, NodeId child)
{
    (void)nodes_.at(child);
    mutable_node(array, ValueKind::Array, "Document::append").items.push_back(child);
}

void Document::insert(NodeId object, std::string key, NodeId child)
{
    (void)nodes_.at(child);
    mutable_node(object, ValueKind::Object, "Document::insert").members.emplace_back(std::move(key), child);
}

void Document::set_root(NodeId id)
{
    (void)nodes_.at(id);
    root_ = id;
}

// ============================================================
// build_tree
// ============================================================

namespace {

class TreeResolver {
public:
    TreeResolver(const Document& doc, const TreeBuildOptions& options)
        : doc_(doc)
        , options_(options)
        , on_stack_(doc.size(), false)
    {
        current_path_.reserve(16);
    }

    ValueBox resolve(NodeId id, std::size_t depth)
    {
        if (depth > options_.max_depth) [[unlikely]] {
            throw CyclicReferenceError(current_path_.to_json_pointer(),
                                       "document nesting exceeds maximum depth of "
                                       + std::to_string(options_.max_depth) + " at '"
                                       + current_path_.to_json_pointer() + "'");
        }

        const auto& node = doc_.node(id);
        switch (node.kind) {
            case ValueKind::Null:   return ValueBox{Value{}};
            case ValueKind::Bool:   return ValueBox{Value{node.boolean}};
            case ValueKind::Number: return ValueBox{Value{node.number}};
            case ValueKind::String: return ValueBox{Value{node.text}};
            case ValueKind::Array:
            case ValueKind::Object:
                break;
        }

        // Aliased container already resolved: share it
        if (auto it = resolved_.find(id); it != resolved_.end()) {
            return it->second;
        }

        if (on_stack_[id]) [[unlikely]] {
            throw CyclicReferenceError(current_path_.to_json_pointer(),
                                       "cyclic reference at '" + current_path_.to_json_pointer() + "'");
        }

        on_stack_[id] = true;
        ValueBox result = node.kind == ValueKind::Array
                              ? resolve_array(node, depth)
                              : resolve_object(node, depth);
        on_stack_[id] = false;

        resolved_.emplace(id, result);
        return result;
    }

private:
    ValueBox resolve_array(const DocumentNode& node, std::size_t depth)
    {
        ArrayBuilder builder;
        for (std::size_t i = 0; i < node.items.size(); ++i) {
            current_path_.push_back(i);
            builder.push_back_box(resolve(node.items[i], depth + 1));
            current_path_.pop_back();
        }
        return ValueBox{builder.finish()};
    }

    ValueBox resolve_object(const DocumentNode& node, std::size_t depth)
    {
        ObjectBuilder builder;
        for (const auto& [key, child] : node.members) {
            if (builder.contains(key)) {
                detail::log_key_error("build_tree", key, "duplicate key, last value wins");
            }
            current_path_.push_back(key);
            builder.set_box(key, resolve(child, depth + 1));
            current_path_.pop_back();
        }
        return ValueBox{builder.finish()};
    }

    const Document& doc_;
    const TreeBuildOptions& options_;
    std::vector<bool> on_stack_;                     // nodes on the current recursion stack
    std::unordered_map<NodeId, ValueBox> resolved_;  // finished containers, for alias sharing
    Path current_path_;
};

} // anonymous namespace

Value build_tree(const Document& doc, const TreeBuildOptions& options)
{
    auto root = doc.root();
    if (!root) {
        return Value{};
    }
    TreeResolver resolver{doc, options};
    return resolver.resolve(*root, 0).get();
}

} // namespace semdiff
