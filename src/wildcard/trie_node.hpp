#pragma once
#include <unordered_map>
#include <memory>
#include <optional>
#include <string>

#include "common/utf8.hpp"

struct TrieNode {
    // empty only for the root, which stands for the empty prefix
    std::optional<char32_t> c;
    bool isWord{false};

    std::unordered_map<char32_t, std::unique_ptr<TrieNode>> children;

    TrieNode() = default;
    explicit TrieNode(char32_t ch) : c(ch) {}

    bool isRoot() const { return !c.has_value(); }
    bool hasChild() const { return !children.empty(); }

    TrieNode* getChild(char32_t ch) {
        auto it = children.find(ch);
        return (it == children.end()) ? nullptr : it->second.get();
    }
    const TrieNode* getChild(char32_t ch) const {
        auto it = children.find(ch);
        return (it == children.end()) ? nullptr : it->second.get();
    }

    // Keeps the existing child if one is already keyed by node->c.
    void addChild(std::unique_ptr<TrieNode> node) {
        if (!node || node->isRoot())
            return;
        const char32_t ch = *node->c;
        if (children.find(ch) == children.end()) {
            children.emplace(ch, std::move(node));
        }
    }

    // "[c -> k1 k2 ...]", root shown as '^'
    std::string toString() const {
        std::string out = "[";
        if (c)
            append_utf8(out, *c);
        else
            out.push_back('^');
        out += " ->";
        for (const auto& kv : children) {
            out.push_back(' ');
            append_utf8(out, kv.first);
        }
        out.push_back(']');
        return out;
    }
};
