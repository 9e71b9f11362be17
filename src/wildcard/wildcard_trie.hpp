#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "wildcard/invalid_word_error.hpp"
#include "wildcard/trie_node.hpp"

// Trie whose lookups accept a wildcard character matching any single
// character at its position. Words are inserted once and never removed.
//
// Not thread-safe: concurrent readers are fine only while nothing inserts.
class WildcardTrie {
public:
    static constexpr char32_t kDefaultWildcard = U'*';

    WildcardTrie();
    // std::nullopt disables wildcard matching altogether.
    explicit WildcardTrie(std::optional<char32_t> wildcard);
    // Tears the tree down without recursing once per level.
    ~WildcardTrie();

    WildcardTrie(WildcardTrie&& other);
    WildcardTrie& operator=(WildcardTrie&& other);
    WildcardTrie(const WildcardTrie&) = delete;
    WildcardTrie& operator=(const WildcardTrie&) = delete;

    // Throws InvalidWordError for an empty word, a null word, or one that
    // contains the wildcard. The trie is left untouched on failure.
    void insert(const std::u32string& word);
    void insert(const char32_t* word);
    void insertUtf8(std::string_view word);

    // Stops at the first invalid word; earlier words stay inserted.
    // A null set is a no-op.
    void insertAll(const std::unordered_set<std::u32string>& words);
    void insertAll(const std::unordered_set<std::u32string>* words);

    bool isPrefix(const std::u32string& term) const;
    bool isPrefix(const char32_t* term) const;

    bool isWord(const std::u32string& term) const;
    bool isWord(const char32_t* term) const;

    std::unordered_set<std::u32string> getMatchingWords(const std::u32string& term) const;
    std::unordered_set<std::u32string> getMatchingWords(const char32_t* term) const;

    // Breadth-first visit of every node, root first.
    template <class Visitor>
    void forEachLevelOrder(Visitor&& visit) const {
        std::queue<const TrieNode*> q;
        q.push(root.get());

        while (!q.empty()) {
            const TrieNode* node = q.front();
            q.pop();

            visit(*node);
            for (const auto& kv : node->children) {
                if (kv.second)
                    q.push(kv.second.get());
            }
        }
    }

    std::string render() const;

    std::optional<char32_t> wildcard() const { return wildcard_; }
    size_t size() const { return wordCount; }
    size_t nodeCount() const { return nodeCount_; }
    bool empty() const { return wordCount == 0; }

    const TrieNode* getRoot() const;

private:
    static void destroyTree(std::unique_ptr<TrieNode> node);

    bool isWildcard(char32_t ch) const;
    bool containsWildcard(const std::u32string& word) const;

    template <class Accept>
    bool walk(const TrieNode* node,
              const std::u32string& term,
              size_t index,
              std::u32string& path,
              Accept& accept) const;

    std::unique_ptr<TrieNode> root;
    std::optional<char32_t> wildcard_;
    size_t wordCount;
    size_t nodeCount_;
};
