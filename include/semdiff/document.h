// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file document.h
/// @brief Reader-side document graph and its conversion into a Value tree.
///
/// Readers (JSON, YAML) produce a Document: an arena of nodes addressed by
/// NodeId. Unlike a Value tree a Document may alias nodes (YAML anchors)
/// and may even contain cycles. build_tree() resolves it into an acyclic,
/// immutable Value, sharing aliased sub-trees and rejecting cycles.
///
/// Usage:
/// @code
///   Document doc;
///   auto root = doc.add_object();
///   auto list = doc.add_array();
///   doc.append(list, doc.add_number(1));
///   doc.insert(root, "items", list);
///   doc.insert(root, "again", list);   // alias: resolved once, shared
///   doc.set_root(root);
///
///   Value tree = build_tree(doc);
/// @endcode

#pragma once

#include <semdiff/api.h>
#include <semdiff/value.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace semdiff {

// ============================================================
// Errors
// ============================================================

/// Raised by build_tree() when resolution would recurse without bound:
/// a node that is its own ancestor, or nesting beyond the depth limit.
class SEMDIFF_API CyclicReferenceError : public std::runtime_error {
public:
    CyclicReferenceError(std::string pointer, const std::string& message)
        : std::runtime_error(message)
        , pointer_(std::move(pointer))
    {}

    /// JSON Pointer of the location where resolution stopped
    [[nodiscard]] const std::string& pointer() const noexcept { return pointer_; }

private:
    std::string pointer_;
};

/// Raised by the readers and document loading on malformed or unreadable input
class SEMDIFF_API ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error(message)
    {}

    ParseError(const std::string& message, std::size_t line, std::size_t column)
        : std::runtime_error(message + " at line " + std::to_string(line)
                             + ", column " + std::to_string(column))
        , line_(line)
        , column_(column)
    {}

    /// 1-based line of the error, 0 when unknown
    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    /// 1-based column of the error, 0 when unknown
    [[nodiscard]] std::size_t column() const noexcept { return column_; }

private:
    std::size_t line_ = 0;
    std::size_t column_ = 0;
};

// ============================================================
// Document
// ============================================================

using NodeId = std::size_t;

/// One node of the document graph. Only the fields matching @c kind are used.
struct DocumentNode {
    ValueKind kind = ValueKind::Null;
    bool boolean = false;
    double number = 0.0;
    std::string text;
    std::vector<NodeId> items;                               ///< Array elements
    std::vector<std::pair<std::string, NodeId>> members;     ///< Object members, source order
};

class SEMDIFF_API Document {
public:
    Document() = default;

    // Node creation; each returns the id of the new node
    NodeId add_null();
    NodeId add_bool(bool value);
    NodeId add_number(double value);
    NodeId add_string(std::string value);
    NodeId add_array();
    NodeId add_object();

    /// Append @p child to an array node
    /// @throws std::invalid_argument if @p array is not an array node
    /// @throws std::out_of_range on an unknown id
    void append(NodeId array, NodeId child);

    /// Add a member to an object node. Duplicate keys are kept here and
    /// resolved by build_tree() (first position, last value).
    /// @throws std::invalid_argument if @p object is not an object node
    /// @throws std::out_of_range on an unknown id
    void insert(NodeId object, std::string key, NodeId child);

    /// @throws std::out_of_range on an unknown id
    void set_root(NodeId id);

    /// Root node, or nullopt for an empty document
    [[nodiscard]] std::optional<NodeId> root() const noexcept { return root_; }

    /// @throws std::out_of_range on an unknown id
    [[nodiscard]] const DocumentNode& node(NodeId id) const { return nodes_.at(id); }

    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

private:
    NodeId add_node(DocumentNode node);
    DocumentNode& mutable_node(NodeId id, ValueKind expected, const char* func);

    std::vector<DocumentNode> nodes_;
    std::optional<NodeId> root_;
};

// ============================================================
// Tree construction
// ============================================================

struct TreeBuildOptions {
    /// Maximum nesting depth; deeper documents raise CyclicReferenceError
    std::size_t max_depth = SEMDIFF_DEFAULT_MAX_DEPTH;
};

/// Resolve @p doc into an immutable Value tree.
///
/// Nodes reachable through several aliases are resolved once and the
/// resulting sub-tree is shared. An empty document yields Null.
/// @throws CyclicReferenceError on a cycle or when max_depth is exceeded;
///         no partial tree is returned
[[nodiscard]] SEMDIFF_API Value build_tree(const Document& doc, const TreeBuildOptions& options = {});

} // namespace semdiff
