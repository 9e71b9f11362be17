#include "word_list_loader.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "common/utf8.hpp"
#include "wildcard/wildcard_trie.hpp"

WordListLoadStats loadWordList(WildcardTrie &trie, std::istream &in)
{
    WordListLoadStats stats;
    std::string line;

    while (std::getline(in, line))
    {
        ++stats.lines;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::u32string word;
        if (!utf8_to_u32(line, word))
        {
            ++stats.skipped;
            std::cerr << "[BAD_UTF8] line " << stats.lines << "\n";
            continue;
        }

        try
        {
            trie.insert(word);
            ++stats.inserted;
        }
        catch (const InvalidWordError &e)
        {
            ++stats.skipped;
            std::cerr << "[SKIP] line " << stats.lines << ": " << e.what() << "\n";
        }
    }
    return stats;
}

WordListLoadStats loadWordListFromFile(WildcardTrie &trie, const std::string &path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Failed to open: " + path);
    return loadWordList(trie, in);
}
