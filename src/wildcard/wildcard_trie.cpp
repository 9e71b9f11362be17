#include "wildcard_trie.hpp"

#include <vector>

#include "common/utf8.hpp"

WildcardTrie::WildcardTrie() : WildcardTrie(kDefaultWildcard) {}

WildcardTrie::WildcardTrie(std::optional<char32_t> wildcard)
    : root(std::make_unique<TrieNode>()), wildcard_(wildcard), wordCount(0), nodeCount_(1) {}

WildcardTrie::~WildcardTrie() { destroyTree(std::move(root)); }

// A moved-from trie keeps a fresh root so it stays usable.
WildcardTrie::WildcardTrie(WildcardTrie&& other)
    : root(std::exchange(other.root, std::make_unique<TrieNode>())),
      wildcard_(other.wildcard_),
      wordCount(std::exchange(other.wordCount, 0)),
      nodeCount_(std::exchange(other.nodeCount_, 1)) {}

WildcardTrie& WildcardTrie::operator=(WildcardTrie&& other) {
    if (this != &other) {
        destroyTree(std::exchange(root, std::exchange(other.root, std::make_unique<TrieNode>())));
        wildcard_ = other.wildcard_;
        wordCount = std::exchange(other.wordCount, 0);
        nodeCount_ = std::exchange(other.nodeCount_, 1);
    }
    return *this;
}

// Detaches children before each node dies so no destructor recurses.
void WildcardTrie::destroyTree(std::unique_ptr<TrieNode> node) {
    std::vector<std::unique_ptr<TrieNode>> pending;
    if (node)
        pending.push_back(std::move(node));

    while (!pending.empty()) {
        std::unique_ptr<TrieNode> cur = std::move(pending.back());
        pending.pop_back();
        for (auto& kv : cur->children) {
            if (kv.second)
                pending.push_back(std::move(kv.second));
        }
        cur->children.clear();
    }
}

bool WildcardTrie::isWildcard(char32_t ch) const {
    return wildcard_ && *wildcard_ == ch;
}

bool WildcardTrie::containsWildcard(const std::u32string& word) const {
    return wildcard_ && word.find(*wildcard_) != std::u32string::npos;
}

void WildcardTrie::insert(const std::u32string& word) {
    if (word.empty() || containsWildcard(word))
        throw InvalidWordError(u32_to_utf8(word));

    TrieNode* cur = root.get();
    for (char32_t ch : word) {
        if (auto* nxt = cur->getChild(ch)) {
            cur = nxt;
        } else {
            auto node = std::make_unique<TrieNode>(ch);
            TrieNode* raw = node.get();
            cur->addChild(std::move(node));
            ++nodeCount_;
            cur = raw;
        }
    }

    if (!cur->isWord) {
        cur->isWord = true;
        ++wordCount;
    }
}

void WildcardTrie::insert(const char32_t* word) {
    if (!word)
        throw InvalidWordError("null");
    insert(std::u32string(word));
}

void WildcardTrie::insertUtf8(std::string_view word) {
    std::u32string w;
    if (!utf8_to_u32(word, w))
        throw InvalidWordError("<malformed UTF-8>");
    insert(w);
}

void WildcardTrie::insertAll(const std::unordered_set<std::u32string>& words) {
    for (const auto& w : words)
        insert(w);
}

void WildcardTrie::insertAll(const std::unordered_set<std::u32string>* words) {
    if (words)
        insertAll(*words);
}

// Follows every resolution of term[index..] below node and hands each node
// reached at the end of the term to accept, together with the characters
// actually consumed. Returns true as soon as accept does.
template <class Accept>
bool WildcardTrie::walk(const TrieNode* node,
                        const std::u32string& term,
                        size_t index,
                        std::u32string& path,
                        Accept& accept) const {
    if (index == term.size())
        return accept(*node, path);

    const char32_t ch = term[index];
    if (!isWildcard(ch)) {
        const TrieNode* next = node->getChild(ch);
        if (!next)
            return false;
        path.push_back(ch);
        const bool done = walk(next, term, index + 1, path, accept);
        path.pop_back();
        return done;
    }

    for (const auto& kv : node->children) {
        path.push_back(kv.first);
        const bool done = walk(kv.second.get(), term, index + 1, path, accept);
        path.pop_back();
        if (done)
            return true;
    }
    return false;
}

bool WildcardTrie::isPrefix(const std::u32string& term) const {
    if (term.empty())
        return false;

    // a stored word counts only if something longer extends it
    auto accept = [](const TrieNode& node, const std::u32string&) { return node.hasChild(); };
    std::u32string path;
    path.reserve(term.size());
    return walk(root.get(), term, 0, path, accept);
}

bool WildcardTrie::isPrefix(const char32_t* term) const {
    return term && isPrefix(std::u32string(term));
}

bool WildcardTrie::isWord(const std::u32string& term) const {
    if (term.empty())
        return false;

    auto accept = [](const TrieNode& node, const std::u32string&) { return node.isWord; };
    std::u32string path;
    path.reserve(term.size());
    return walk(root.get(), term, 0, path, accept);
}

bool WildcardTrie::isWord(const char32_t* term) const {
    return term && isWord(std::u32string(term));
}

std::unordered_set<std::u32string> WildcardTrie::getMatchingWords(const std::u32string& term) const {
    std::unordered_set<std::u32string> result;
    if (term.empty() || empty())
        return result;

    auto accept = [&result](const TrieNode& node, const std::u32string& path) {
        if (node.isWord)
            result.insert(path);
        return false;
    };
    std::u32string path;
    path.reserve(term.size());
    walk(root.get(), term, 0, path, accept);
    return result;
}

std::unordered_set<std::u32string> WildcardTrie::getMatchingWords(const char32_t* term) const {
    if (!term)
        return {};
    return getMatchingWords(std::u32string(term));
}

std::string WildcardTrie::render() const {
    std::string out;
    forEachLevelOrder([&out](const TrieNode& node) { out += node.toString(); });
    return out;
}

const TrieNode* WildcardTrie::getRoot() const { return root.get(); }
