#pragma once
#include <cstddef>
#include <istream>
#include <string>

class WildcardTrie;

struct WordListLoadStats
{
    size_t lines{0};
    size_t inserted{0};
    size_t skipped{0};
};

// One word per line (UTF-8). Lines the trie rejects are reported on stderr
// and skipped; the rest are inserted.
WordListLoadStats loadWordList(WildcardTrie &trie, std::istream &in);

// Throws std::runtime_error if the file cannot be opened.
WordListLoadStats loadWordListFromFile(WildcardTrie &trie, const std::string &path);
